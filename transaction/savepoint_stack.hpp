// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace txnest {
    // Savepoints currently open on a connection, outermost first.
    // An empty name marks the unnamed top-level transaction.
    class savepoint_stack {
    public:
        void push(std::string name);

        // removes and returns the top unconditionally; callers compare it with what they expected
        std::string pop();

        const std::string& top() const;
        std::size_t size() const noexcept;
        bool empty() const noexcept;
        bool contains(std::string_view name) const noexcept;
        const std::vector<std::string>& names() const noexcept;

    private:
        std::vector<std::string> names_{};
    };
} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "savepoint_stack.hpp"
#include "errors.hpp"

#include <algorithm>

namespace txnest {
    void savepoint_stack::push(std::string name) { names_.emplace_back(std::move(name)); }

    std::string savepoint_stack::pop() {
        if (names_.empty()) {
            throw internal_error("savepoint stack is empty, nothing to pop");
        }
        auto name = std::move(names_.back());
        names_.pop_back();
        return name;
    }

    const std::string& savepoint_stack::top() const {
        if (names_.empty()) {
            throw internal_error("savepoint stack is empty, no top");
        }
        return names_.back();
    }

    std::size_t savepoint_stack::size() const noexcept { return names_.size(); }

    bool savepoint_stack::empty() const noexcept { return names_.empty(); }

    bool savepoint_stack::contains(std::string_view name) const noexcept {
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }

    const std::vector<std::string>& savepoint_stack::names() const noexcept { return names_; }
} // namespace txnest

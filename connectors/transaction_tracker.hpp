// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "transaction/transaction_status.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace txnest {
    // Client-side view of the server transaction state, fed with every batch the
    // session runs. Only transaction control statements are recognised.
    class transaction_tracker {
    public:
        void observe(std::string_view batch);
        // the batch failed somewhere in the middle, the server state is unknown
        void observe_failure(std::string_view batch);

        bool handle_begin();
        bool handle_commit();
        bool handle_rollback();

        bool handle_savepoint(std::string name);
        bool handle_rollback_to_savepoint(const std::string& name);
        bool handle_release_savepoint(const std::string& name);

        transaction_status get_transaction_status() const;
        const std::vector<std::string>& savepoints() const;
        void mark_failed();
        void reset();

    private:
        transaction_status state_ = transaction_status::IDLE;
        std::vector<std::string> savepoints_{};
    };

    // splits on ';' outside quotes, trimming whitespace and dropping empty statements
    std::vector<std::string_view> split_statements(std::string_view batch);
} // namespace txnest

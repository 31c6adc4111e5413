// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "transaction.hpp"
#include "connectors/connection.hpp"
#include "errors.hpp"

#include <mutex>

namespace txnest {
    transaction::transaction(connection& conn, transaction_options options)
        : transaction_base(conn, std::move(options))
        , conn_(conn) {}

    transaction& transaction::enter() {
        std::lock_guard<std::mutex> lock(conn_.mutex());
        auto commands = enter_commands();
        try {
            conn_.execute_locked(join(commands));
        } catch (const std::exception&) {
            abandon_entry();
            throw;
        }
        return *this;
    }

    bool transaction::exit(const outcome& result) {
        std::lock_guard<std::mutex> lock(conn_.mutex());
        check_exit();
        if (commits(result)) {
            conn_.execute_locked(join(commit_commands()));
            return false;
        }
        return rollback(result);
    }

    bool transaction::rollback(const outcome& result) {
        // try to rollback, but if there are problems (connection in a bad state)
        // just warn without clobbering the signal bubbling up
        try {
            conn_.execute_locked(join(rollback_commands(result)));
        } catch (const out_of_order_nesting&) {
            throw;
        } catch (const internal_error&) {
            throw;
        } catch (const std::exception& e) {
            rollback_failed();
            conn_.log()->warn("error ignored in rollback of {}: {}", describe(), e.what());
            return false;
        }
        return swallows(result);
    }
} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "async_transaction.hpp"
#include "connectors/async_connection.hpp"
#include "errors.hpp"

namespace txnest {
    async_transaction::async_transaction(async_connection& conn, transaction_options options)
        : transaction_base(conn, std::move(options))
        , conn_(conn) {}

    asio::awaitable<void> async_transaction::enter() {
        auto lock = co_await conn_.lock().scoped_lock();
        auto commands = enter_commands();
        std::exception_ptr error;
        try {
            co_await conn_.execute_locked(join(commands));
        } catch (const std::exception&) {
            error = std::current_exception();
        }
        if (error) {
            abandon_entry();
            std::rethrow_exception(error);
        }
    }

    asio::awaitable<bool> async_transaction::exit(outcome result) {
        auto lock = co_await conn_.lock().scoped_lock();
        check_exit();
        if (commits(result)) {
            co_await conn_.execute_locked(join(commit_commands()));
            co_return false;
        }
        co_return co_await rollback(result);
    }

    asio::awaitable<bool> async_transaction::rollback(const outcome& result) {
        try {
            co_await conn_.execute_locked(join(rollback_commands(result)));
        } catch (const out_of_order_nesting&) {
            throw;
        } catch (const internal_error&) {
            throw;
        } catch (const std::exception& e) {
            rollback_failed();
            conn_.log()->warn("error ignored in rollback of {}: {}", describe(), e.what());
            co_return false;
        }
        co_return swallows(result);
    }
} // namespace txnest

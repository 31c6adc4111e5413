// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "basic_connection.hpp"
#include "transaction/async_transaction.hpp"
#include "utility/async_mutex.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_state.hpp>
#include <boost/asio/this_coro.hpp>

#include <exception>
#include <memory>
#include <string>

namespace txnest {

    /**
     * Coroutine connection.
     *
     * All users must run on one single-threaded executor. The async lock is
     * held for the whole of each transaction entry and exit, suspension
     * included, so no two scope operations on this connection interleave.
     */
    class async_connection final : public basic_connection {
    public:
        explicit async_connection(std::unique_ptr<ISession> session, log_t log = nullptr);

        ISession& session() override { return *session_; }
        const ISession& session() const override { return *session_; }

        async_mutex& lock() noexcept { return lock_; }

        transaction_status get_transaction_status() const { return session_->get_transaction_status(); }

        asio::awaitable<command_result> execute(std::string query);
        asio::awaitable<command_result> execute_prepared(std::string query);

        asio::awaitable<void> set_isolation_level(std::optional<isolation_level> level);
        asio::awaitable<void> set_read_only(std::optional<bool> read_only);
        asio::awaitable<void> set_deferrable(std::optional<bool> deferrable);

        // Coroutine counterpart of connection::transaction: `body` is called
        // with the scope and must return an awaitable<void>.
        template<typename Body>
        asio::awaitable<void> transaction(Body body, transaction_options options = {}) {
            async_transaction tx(*this, std::move(options));
            co_await tx.enter();

            std::exception_ptr signal;
            try {
                co_await body(tx);
            } catch (...) {
                signal = std::current_exception();
            }

            // a cancelled block must still reach the server, or the stack and
            // the server state drift apart for good
            co_await asio::this_coro::reset_cancellation_state(asio::disable_cancellation());
            bool handled = false;
            std::exception_ptr exit_error;
            try {
                handled = co_await tx.exit(signal ? outcome::signaled(signal) : outcome::completed());
            } catch (...) {
                exit_error = std::current_exception();
            }
            co_await asio::this_coro::reset_cancellation_state();

            if (exit_error) {
                std::rethrow_exception(exit_error);
            }
            if (signal && !handled) {
                std::rethrow_exception(signal);
            }
        }

        // runs one batch, the caller must hold lock()
        asio::awaitable<command_result> execute_locked(std::string batch);

    private:
        std::unique_ptr<ISession> session_;
        async_mutex lock_;
    };

} // namespace txnest

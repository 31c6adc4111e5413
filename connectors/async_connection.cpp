// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "async_connection.hpp"
#include "transaction/errors.hpp"

namespace txnest {
    async_connection::async_connection(std::unique_ptr<ISession> session, log_t log)
        : basic_connection(std::move(log))
        , session_(std::move(session)) {
        if (!session_) {
            throw usage_error("async connection created without a session");
        }
        this->log()->debug("async connection opened on {}", session_->describe());
    }

    asio::awaitable<command_result> async_connection::execute(std::string query) {
        auto guard = co_await lock_.scoped_lock();
        co_return co_await execute_locked(std::move(query));
    }

    asio::awaitable<command_result> async_connection::execute_prepared(std::string query) {
        auto guard = co_await lock_.scoped_lock();
        co_return co_await session_->execute_prepared(std::move(query));
    }

    asio::awaitable<void> async_connection::set_isolation_level(std::optional<isolation_level> level) {
        auto guard = co_await lock_.scoped_lock();
        apply_isolation_level(level);
    }

    asio::awaitable<void> async_connection::set_read_only(std::optional<bool> read_only) {
        auto guard = co_await lock_.scoped_lock();
        apply_read_only(read_only);
    }

    asio::awaitable<void> async_connection::set_deferrable(std::optional<bool> deferrable) {
        auto guard = co_await lock_.scoped_lock();
        apply_deferrable(deferrable);
    }

    asio::awaitable<command_result> async_connection::execute_locked(std::string batch) {
        log()->debug("{}: {}", session_->describe(), batch);
        co_return co_await session_->execute(std::move(batch));
    }
} // namespace txnest

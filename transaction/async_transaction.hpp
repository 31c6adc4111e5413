// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "transaction_base.hpp"

#include <boost/asio/awaitable.hpp>

namespace txnest {

    class async_connection;

    // Transaction scope for the coroutine connection. Round trips suspend the
    // calling coroutine while the connection's async lock is held.
    class async_transaction final : public transaction_base {
    public:
        explicit async_transaction(async_connection& conn, transaction_options options = {});

        async_connection& conn() noexcept { return conn_; }

        boost::asio::awaitable<void> enter();

        // Same contract as transaction::exit. A cancelled caller must disable
        // cancellation before awaiting it (see async_connection::transaction),
        // otherwise the co_await itself throws and the exit never runs.
        boost::asio::awaitable<bool> exit(outcome result);

    private:
        boost::asio::awaitable<bool> rollback(const outcome& result);

        async_connection& conn_;
    };

} // namespace txnest

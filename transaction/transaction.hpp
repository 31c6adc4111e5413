// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "transaction_base.hpp"

namespace txnest {

    class connection;

    // Transaction scope for the blocking connection. Every round trip blocks the
    // calling thread while the connection lock is held.
    class transaction final : public transaction_base {
    public:
        explicit transaction(connection& conn, transaction_options options = {});

        connection& conn() noexcept { return conn_; }

        transaction& enter();

        // Returns true when the signal in `result` is handled here and must not
        // propagate further. Throws out_of_order_nesting when the scope is not
        // on top of the savepoint stack.
        bool exit(const outcome& result);

    private:
        bool rollback(const outcome& result);

        connection& conn_;
    };

} // namespace txnest

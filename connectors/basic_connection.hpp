// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "session.hpp"
#include "transaction/savepoint_stack.hpp"
#include "transaction/transaction_options.hpp"
#include "utility/logger.hpp"

#include <string>
#include <string_view>

namespace txnest {

    // State shared by the blocking and the coroutine connection: the session,
    // the savepoint stack and the start characteristics. Locking is left to
    // the derived classes, every mutation here expects the lock to be held.
    class basic_connection {
    public:
        virtual ~basic_connection() = default;

        basic_connection(const basic_connection&) = delete;
        basic_connection& operator=(const basic_connection&) = delete;

        virtual ISession& session() = 0;
        virtual const ISession& session() const = 0;

        savepoint_stack& savepoints() noexcept { return savepoints_; }
        const savepoint_stack& savepoints() const noexcept { return savepoints_; }

        const transaction_characteristics& characteristics() const noexcept { return characteristics_; }

        const log_t& log() const noexcept { return log_; }

        // reads the session state unlocked: call it with the connection lock held, or from the
        // thread driving the connection while no round trip is in flight
        std::string describe() const;

    protected:
        explicit basic_connection(log_t log);

        // characteristics can only change between transactions
        void check_idle(std::string_view what) const;
        void apply_isolation_level(std::optional<isolation_level> level);
        void apply_read_only(std::optional<bool> read_only);
        void apply_deferrable(std::optional<bool> deferrable);

    private:
        savepoint_stack savepoints_;
        transaction_characteristics characteristics_;
        log_t log_;
    };

} // namespace txnest

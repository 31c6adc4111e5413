// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "outcome.hpp"
#include "transaction_options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace txnest {

    class basic_connection;

    enum class transaction_state
    {
        INACTIVE,
        ACTIVE,
        TERMINATED,
    };

    std::string_view to_string(transaction_state state) noexcept;

    /**
     * One nesting level of a transaction: the outer transaction or a savepoint.
     *
     * Computes the commands for entering and leaving its level and keeps the
     * connection's savepoint stack in step with them. It performs no I/O: the
     * blocking and the coroutine scopes execute the batches it produces while
     * holding the connection lock.
     */
    class transaction_base {
    public:
        transaction_base(const transaction_base&) = delete;
        transaction_base& operator=(const transaction_base&) = delete;

        // empty for the unnamed outer transaction; generated names appear on entry
        const std::string& savepoint_name() const noexcept { return savepoint_name_; }
        bool force_rollback() const noexcept { return force_rollback_; }
        bool is_outer_transaction() const noexcept { return outer_transaction_; }
        bool entered() const noexcept { return entered_; }
        bool exited() const noexcept { return exited_; }
        transaction_state state() const noexcept;

        std::string describe() const;

        static std::string join(const std::vector<std::string>& commands);

    protected:
        transaction_base(basic_connection& conn, transaction_options options);
        ~transaction_base() = default;

        basic_connection& base_connection() noexcept { return conn_; }

        // true when the block outcome leads to a commit
        bool commits(const outcome& result) const noexcept;

        std::vector<std::string> enter_commands();
        std::vector<std::string> commit_commands();
        std::vector<std::string> rollback_commands(const outcome& result);

        // the rollback batch did not reach the server: its DEALLOCATE commands go back to the session
        void rollback_failed();

        // the rollback signal stops here when it targets this scope or nobody
        bool swallows(const outcome& result) const;

        // undo the push of enter_commands() after the entry round trip failed
        void abandon_entry() noexcept;

        void check_exit() const;

    private:
        // name the scope will push, checking the stack against the session status
        std::string plan_savepoint(bool outer) const;
        void pop_savepoint(std::string_view action);
        std::string generate_name() const;

        basic_connection& conn_;
        std::string savepoint_name_;
        bool force_rollback_;
        bool outer_transaction_ = false;
        bool entered_ = false;
        bool exited_ = false;
        std::vector<std::string> maintenance_{};
    };

} // namespace txnest

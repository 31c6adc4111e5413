// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "basic_connection.hpp"
#include "transaction/transaction.hpp"
#include "utility/io_thread.hpp"

#include <boost/asio/io_context.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace txnest {

    using session_factory = std::function<std::unique_ptr<ISession>(asio::io_context&)>;

    /**
     * Blocking connection.
     *
     * The session runs on a private io thread; callers block until each round
     * trip completes. A mutex serializes transaction entry and exit with any
     * other command sent through this connection.
     */
    class connection final : public basic_connection {
    public:
        explicit connection(const session_factory& factory, log_t log = nullptr);
        ~connection() override;

        ISession& session() override { return *session_; }
        const ISession& session() const override { return *session_; }

        std::mutex& mutex() noexcept { return mutex_; }

        // waits for any round trip in flight
        transaction_status get_transaction_status() const;

        command_result execute(std::string query);
        command_result execute_prepared(std::string query);

        void set_isolation_level(std::optional<isolation_level> level);
        void set_read_only(std::optional<bool> read_only);
        void set_deferrable(std::optional<bool> deferrable);

        // Runs `body(transaction&)` inside a new transaction scope. An exception
        // escaping the body rolls the scope back and is rethrown unless it is a
        // rollback signal addressed to this scope.
        template<typename Body>
        void transaction(Body&& body, transaction_options options = {}) {
            txnest::transaction tx(*this, std::move(options));
            tx.enter();

            std::exception_ptr signal;
            try {
                std::forward<Body>(body)(tx);
            } catch (...) {
                signal = std::current_exception();
            }

            if (!signal) {
                tx.exit(outcome::completed());
                return;
            }
            if (!tx.exit(outcome::signaled(signal))) {
                std::rethrow_exception(signal);
            }
        }

        // runs one batch on the io thread, the caller must hold mutex()
        command_result execute_locked(std::string batch);

    private:
        template<typename Awaitable>
        command_result wait(Awaitable&& op);

        io_thread io_;
        std::unique_ptr<ISession> session_;
        mutable std::mutex mutex_;
    };

} // namespace txnest

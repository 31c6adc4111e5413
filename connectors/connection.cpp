// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "connection.hpp"
#include "transaction/errors.hpp"
#include "utility/cv_wrapper.hpp"

#include <boost/asio/co_spawn.hpp>

namespace txnest {
    connection::connection(const session_factory& factory, log_t log)
        : basic_connection(std::move(log)) {
        io_.start();
        session_ = factory(io_.ctx());
        if (!session_) {
            throw usage_error("session factory returned no session");
        }
        this->log()->debug("connection opened on {}", session_->describe());
    }

    connection::~connection() {
        if (!savepoints().empty()) {
            log()->warn("{}: closed with {} transaction scopes still open", describe(), savepoints().size());
        }
        io_.stop();
        session_.reset();
    }

    transaction_status connection::get_transaction_status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_->get_transaction_status();
    }

    command_result connection::execute(std::string query) {
        std::lock_guard<std::mutex> lock(mutex_);
        return execute_locked(std::move(query));
    }

    command_result connection::execute_prepared(std::string query) {
        std::lock_guard<std::mutex> lock(mutex_);
        return wait(session_->execute_prepared(std::move(query)));
    }

    void connection::set_isolation_level(std::optional<isolation_level> level) {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_isolation_level(level);
    }

    void connection::set_read_only(std::optional<bool> read_only) {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_read_only(read_only);
    }

    void connection::set_deferrable(std::optional<bool> deferrable) {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_deferrable(deferrable);
    }

    command_result connection::execute_locked(std::string batch) {
        log()->debug("{}: {}", session_->describe(), batch);
        return wait(session_->execute(std::move(batch)));
    }

    template<typename Awaitable>
    command_result connection::wait(Awaitable&& op) {
        if (io_.running_in_this_thread()) {
            throw usage_error("blocking connection used from its own io thread");
        }

        auto state = create_cv_wrapper<command_result>();
        asio::co_spawn(io_.ctx(), std::forward<Awaitable>(op), [state](std::exception_ptr error, command_result result) {
            if (error) {
                state->release_on_error(std::move(error));
            } else {
                state->release(std::move(result));
            }
        });
        return state->get();
    }
} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "connectors/prepared_cache.hpp"
#include "connectors/session.hpp"
#include "connectors/sql_quote.hpp"
#include "connectors/transaction_tracker.hpp"
#include "mock_config.hpp"
#include "transaction/errors.hpp"
#include "transaction/transaction_base.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace txnest {

    // Records every batch and keeps a server-like transaction status by feeding
    // the batches to a transaction_tracker.
    class mock_session : public ISession {
    public:
        explicit mock_session(mock_config config = {})
            : config_(std::move(config)) {}

        std::string quote_identifier(std::string_view name) const override { return sql::quote_identifier(name); }

        asio::awaitable<command_result> execute(std::string batch) override {
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_.load(), in_flight_.load());
            batches_.push_back(batch);

            if (config_.wait_time.count() > 0) {
                asio::steady_timer timer(co_await asio::this_coro::executor, config_.wait_time);
                co_await timer.async_wait(asio::use_awaitable);
            }
            --in_flight_;

            if (!config_.fail_on.empty() && batch.find(config_.fail_on) != std::string::npos) {
                tracker_.observe_failure(batch);
                throw operational_error(config_.error_message, 2013);
            }

            tracker_.observe(batch);
            co_return command_result{split_statements(batch).size(), 0};
        }

        asio::awaitable<command_result> execute_prepared(std::string query) override {
            auto plan = prepared_.plan(query);
            auto maintenance = prepared_.maintenance_commands();
            std::vector<std::string> commands = maintenance;
            if (plan.needs_prepare) {
                commands.emplace_back("PREPARE " + plan.name + " FROM " + sql::quote_literal(query));
            }
            commands.emplace_back("EXECUTE " + plan.name);

            std::exception_ptr error;
            command_result result;
            try {
                result = co_await execute(transaction_base::join(commands));
            } catch (const operational_error&) {
                error = std::current_exception();
            }
            if (error) {
                if (plan.needs_prepare) {
                    prepared_.discard(query);
                }
                prepared_.requeue(std::move(maintenance));
                std::rethrow_exception(error);
            }
            co_return result;
        }

        transaction_status get_transaction_status() const noexcept override {
            return tracker_.get_transaction_status();
        }

        cache_invalidation invalidate_prepared_cache() override {
            ++invalidations_;
            cache_invalidation invalidation;
            invalidation.cleared = prepared_.clear();
            if (invalidation.cleared) {
                invalidation.maintenance_commands = prepared_.maintenance_commands();
            }
            return invalidation;
        }

        void requeue_maintenance(std::vector<std::string> commands) override { prepared_.requeue(std::move(commands)); }

        std::string describe() const override { return "mock://" + config_.alias; }

        const std::vector<std::string>& batches() const noexcept { return batches_; }
        const std::string& last_batch() const { return batches_.back(); }
        void clear_batches() { batches_.clear(); }

        int invalidations() const noexcept { return invalidations_; }
        int max_in_flight() const noexcept { return max_in_flight_.load(); }
        std::size_t prepared_size() const noexcept { return prepared_.size(); }

        void fail_on(std::string text) { config_.fail_on = std::move(text); }

        // the server forgot the transaction behind the client's back
        void reset_server_state() { tracker_.reset(); }

        const transaction_tracker& tracker() const noexcept { return tracker_; }

    private:
        mock_config config_;
        std::vector<std::string> batches_{};
        transaction_tracker tracker_{};
        prepared_cache prepared_{};
        int invalidations_ = 0;
        std::atomic<int> in_flight_{0};
        std::atomic<int> max_in_flight_{0};
    };

} // namespace txnest

// for txnest::connection: hands the created session back through `out`
inline auto mock_session_factory(txnest::mock_session*& out, mock_config config = {}) {
    return [&out, config](boost::asio::io_context&) -> std::unique_ptr<txnest::ISession> {
        auto session = std::make_unique<txnest::mock_session>(config);
        out = session.get();
        return session;
    };
}

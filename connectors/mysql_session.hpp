// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "prepared_cache.hpp"
#include "session.hpp"
#include "transaction_tracker.hpp"
#include "utility/logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace txnest::mysqlc {

    namespace mysql = boost::mysql;

    struct mysql_session_params {
        std::string alias = "mysql";
        std::string host = "127.0.0.1";
        uint16_t port = 3306;
        std::string username;
        std::string password;
        std::string database;
        std::size_t prepared_cache_size = 100;
    };

    enum class Status
    {
        Created,
        Connected,
        Disconnected,
        Closed
    };

    class mysql_session final : public ISession {
    public:
        mysql_session(asio::io_context& io_ctx, mysql_session_params params);
        ~mysql_session() override;

        Status status() const noexcept;
        void connect();
        void close();

        std::string quote_identifier(std::string_view name) const override;
        std::string start_command(const transaction_characteristics& characteristics) const override;
        asio::awaitable<command_result> execute(std::string batch) override;
        asio::awaitable<command_result> execute_prepared(std::string query) override;
        transaction_status get_transaction_status() const noexcept override;
        cache_invalidation invalidate_prepared_cache() override;
        void requeue_maintenance(std::vector<std::string> commands) override;
        std::string describe() const override;

    private:
        asio::awaitable<command_result> run_batch(std::string batch);

        log_t log_;
        mysql::any_connection conn_;
        mysql_session_params params_;
        Status status_;
        transaction_tracker tracker_;
        prepared_cache prepared_;
    };

    // factory suitable for txnest::connection
    inline auto mysql_session_factory(mysql_session_params params) {
        return [params = std::move(params)](asio::io_context& io_ctx) -> std::unique_ptr<ISession> {
            auto session = std::make_unique<mysql_session>(io_ctx, params);
            session->connect();
            return session;
        };
    }

} // namespace txnest::mysqlc

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "mysql_session.hpp"
#include "sql_quote.hpp"
#include "transaction/errors.hpp"
#include "transaction/transaction_base.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/error_code.hpp>
#include <boost/mysql/mariadb_server_errc.hpp>
#include <boost/mysql/mysql_server_errc.hpp>
#include <boost/mysql/results.hpp>

#include <fmt/format.h>

namespace txnest::mysqlc {
    mysql_session::mysql_session(asio::io_context& io_ctx, mysql_session_params params)
        : log_(get_logger(logger_tag::MYSQL_SESSION))
        , conn_(io_ctx)
        , params_{std::move(params)}
        , status_{Status::Created}
        , prepared_(params_.prepared_cache_size) {}

    mysql_session::~mysql_session() { close(); }

    Status mysql_session::status() const noexcept { return status_; }

    void mysql_session::connect() {
        mysql::connect_params params;
        params.server_address.emplace_host_and_port(params_.host, params_.port);
        params.username = params_.username;
        params.password = params_.password;
        params.database = params_.database;
        // transaction batches are sent as one multi-statement round trip
        params.multi_queries = true;

        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.connect(params, ec, diag);
        if (ec) {
            status_ = Status::Disconnected;
            auto error = fmt::format("[{}] connect to {}:{} failed: {} {}",
                                     params_.alias,
                                     params_.host,
                                     params_.port,
                                     ec.message(),
                                     diag.server_message());
            log_->error(error);
            throw operational_error(error, ec.value());
        }
        status_ = Status::Connected;
        tracker_.reset();
        log_->info("[{}] connected to {}:{}", params_.alias, params_.host, params_.port);
    }

    void mysql_session::close() {
        if (status_ != Status::Connected) {
            return;
        }
        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.close(ec, diag);
        if (ec) {
            log_->warn("[{}] close failed: {}", params_.alias, ec.message());
        }
        status_ = Status::Closed;
        log_->info("[{}] connection closed", params_.alias);
    }

    std::string mysql_session::quote_identifier(std::string_view name) const {
        return sql::quote_identifier(name, sql::MYSQL_QUOTE);
    }

    std::string mysql_session::start_command(const transaction_characteristics& characteristics) const {
        if (characteristics.deferrable.value_or(false)) {
            throw usage_error("deferrable transactions are not supported by MySQL");
        }

        std::string command;
        if (characteristics.isolation) {
            // applies to the next transaction only
            command = fmt::format("SET TRANSACTION ISOLATION LEVEL {}; ", to_sql(*characteristics.isolation));
        }
        if (!characteristics.read_only) {
            return command + "BEGIN";
        }
        return command + (*characteristics.read_only ? "START TRANSACTION READ ONLY" : "START TRANSACTION READ WRITE");
    }

    asio::awaitable<command_result> mysql_session::execute(std::string batch) {
        co_return co_await run_batch(std::move(batch));
    }

    asio::awaitable<command_result> mysql_session::execute_prepared(std::string query) {
        auto plan = prepared_.plan(query);

        auto maintenance = prepared_.maintenance_commands();
        std::vector<std::string> commands = maintenance;
        if (plan.needs_prepare) {
            commands.emplace_back(fmt::format("PREPARE {} FROM {}",
                                              plan.name,
                                              sql::quote_literal(query, conn_.backslash_escapes())));
        }
        commands.emplace_back("EXECUTE " + plan.name);

        std::exception_ptr error;
        command_result result;
        try {
            result = co_await run_batch(transaction_base::join(commands));
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

    transaction_status mysql_session::get_transaction_status() const noexcept {
        return tracker_.get_transaction_status();
    }

    cache_invalidation mysql_session::invalidate_prepared_cache() {
        cache_invalidation invalidation;
        invalidation.cleared = prepared_.clear();
        if (invalidation.cleared) {
            invalidation.maintenance_commands = prepared_.maintenance_commands();
        }
        return invalidation;
    }

    void mysql_session::requeue_maintenance(std::vector<std::string> commands) {
        prepared_.requeue(std::move(commands));
    }

    std::string mysql_session::describe() const {
        return fmt::format("mysql://{}@{}:{}/{} [{}]",
                           params_.username,
                           params_.host,
                           params_.port,
                           params_.database,
                           params_.alias);
    }

    asio::awaitable<command_result> mysql_session::run_batch(std::string batch) {
        if (status_ != Status::Connected) {
            std::string err = "[Run query] Session with alias: " + params_.alias + " is not connected";
            log_->error(err);
            throw operational_error(err);
        }

        log_->debug("Alias: {} query: {}", params_.alias, batch);
        boost::system::error_code ec;
        mysql::diagnostics diag;
        mysql::results result;
        co_await conn_.async_execute(batch, result, diag, asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            tracker_.observe_failure(batch);
            if (ec.category() != mysql::get_mysql_server_category() &&
                ec.category() != mysql::get_mariadb_server_category()) {
                // network or protocol failure, the session is unusable
                status_ = Status::Disconnected;
            }
            log_->error("Alias: {} query [{}] failed: {} {}", params_.alias, batch, ec.message(), diag.server_message());
            throw operational_error(fmt::format("[Run query] Alias: {} query [{}]\nfailed: {} {}",
                                                params_.alias,
                                                batch,
                                                ec.message(),
                                                diag.server_message()),
                                    ec.value());
        }

        tracker_.observe(batch);

        command_result summary;
        summary.statements = result.size();
        for (std::size_t i = 0; i < result.size(); ++i) {
            summary.affected_rows += result[i].affected_rows();
        }
        co_return summary;
    }
} // namespace txnest::mysqlc

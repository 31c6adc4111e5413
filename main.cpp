// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "connectors/connection.hpp"
#include "connectors/mysql_session.hpp"
#include "transaction/errors.hpp"
#include "transaction/transaction.hpp"
#include "utility/logger.hpp"

namespace po = boost::program_options;

namespace {
    using namespace txnest;

    // Interactive driver: meta commands open and close scopes by hand, any other
    // line runs as SQL inside whatever scopes are open.
    class shell {
    public:
        explicit shell(connection& conn)
            : conn_(conn)
            , log_(get_logger(logger_tag::SHELL)) {}

        // false once the user asked to quit
        bool handle(const std::string& line) {
            std::istringstream words(line);
            std::string command;
            words >> command;
            std::string argument;
            words >> argument;

            if (command == "\\quit" || command == "\\q") {
                return false;
            } else if (command == "\\begin" || command == "\\begin!") {
                begin(argument, command == "\\begin!");
            } else if (command == "\\commit") {
                commit();
            } else if (command == "\\rollback") {
                rollback_to(argument);
            } else if (command == "\\abort") {
                abort_all();
            } else if (command == "\\status") {
                status();
            } else if (command == "\\isolation") {
                isolation(argument);
            } else if (command == "\\readonly") {
                read_only(argument);
            } else if (!command.empty() && command.front() == '\\') {
                std::cout << "unknown command: " << command << std::endl;
            } else {
                auto result = conn_.execute(line);
                std::cout << "OK, " << result.statements << " statement(s), " << result.affected_rows
                          << " row(s) affected" << std::endl;
            }
            return true;
        }

        // leaves nothing open on the server
        void close() {
            if (!scopes_.empty()) {
                log_->warn("{} scope(s) still open at exit, rolling back", scopes_.size());
                abort_all();
            }
        }

    private:
        void begin(const std::string& name, bool force_rollback) {
            transaction_options options{.force_rollback = force_rollback};
            if (!name.empty()) {
                options.savepoint_name = name;
            }
            auto tx = std::make_unique<transaction>(conn_, std::move(options));
            tx->enter();
            std::cout << "entered " << tx->describe() << std::endl;
            scopes_.push_back(std::move(tx));
        }

        void commit() {
            if (scopes_.empty()) {
                std::cout << "no open scope" << std::endl;
                return;
            }
            auto tx = std::move(scopes_.back());
            scopes_.pop_back();
            tx->exit(outcome::completed());
            std::cout << "left " << tx->describe() << std::endl;
        }

        // level counts from the outermost scope, 1-based; default is the innermost
        void rollback_to(const std::string& level) {
            if (scopes_.empty()) {
                std::cout << "no open scope" << std::endl;
                return;
            }
            std::size_t depth = scopes_.size();
            if (!level.empty()) {
                depth = std::stoul(level);
                if (depth == 0 || depth > scopes_.size()) {
                    std::cout << "no scope at level " << level << std::endl;
                    return;
                }
            }
            unwind(std::make_exception_ptr(rollback(*scopes_[depth - 1])));
        }

        void abort_all() { unwind(std::make_exception_ptr(usage_error("aborted from the shell"))); }

        // hands the signal to the scopes from the innermost out until one handles it
        void unwind(const std::exception_ptr& signal) {
            while (!scopes_.empty()) {
                auto tx = std::move(scopes_.back());
                scopes_.pop_back();
                bool handled = tx->exit(outcome::signaled(signal));
                std::cout << "rolled back " << tx->describe() << std::endl;
                if (handled) {
                    return;
                }
            }
        }

        void status() {
            std::cout << conn_.describe() << std::endl;
            for (std::size_t i = 0; i < scopes_.size(); ++i) {
                std::cout << "  " << (i + 1) << ": " << scopes_[i]->describe() << std::endl;
            }
        }

        void isolation(const std::string& argument) {
            if (argument.empty() || argument == "default") {
                conn_.set_isolation_level(std::nullopt);
                return;
            }
            auto level = parse_isolation_level(argument);
            if (!level) {
                std::cout << "unknown isolation level: " << argument << std::endl;
                return;
            }
            conn_.set_isolation_level(level);
        }

        void read_only(const std::string& argument) {
            if (argument == "on") {
                conn_.set_read_only(true);
            } else if (argument == "off") {
                conn_.set_read_only(false);
            } else if (argument == "default") {
                conn_.set_read_only(std::nullopt);
            } else {
                std::cout << "usage: \\readonly on|off|default" << std::endl;
            }
        }

        connection& conn_;
        log_t log_;
        std::vector<std::unique_ptr<transaction>> scopes_;
    };
} // namespace

int main(int argc, char* argv[]) {
    // Default values
    txnest::mysqlc::mysql_session_params params;
    std::string log_dir = "/tmp/txnest";

    // Define command-line options
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Show help message")
    ("host",
    po::value<std::string>(&params.host)->default_value(params.host),
    "MySQL server host")
    ("port",
    po::value<uint16_t>(&params.port)->default_value(params.port),
    "MySQL server port")
    ("user,u",
    po::value<std::string>(&params.username)->default_value("root"),
    "MySQL user")
    ("password,p",
    po::value<std::string>(&params.password)->default_value(""),
    "MySQL password")
    ("database,d",
    po::value<std::string>(&params.database)->default_value(""),
    "Default database")
    ("alias",
    po::value<std::string>(&params.alias)->default_value(params.alias),
    "Name of the connection in logs")
    ("prepared-cache-size",
    po::value<std::size_t>(&params.prepared_cache_size)->default_value(params.prepared_cache_size),
    "Prepared statements kept per session")
    ("log-dir",
    po::value<std::string>(&log_dir)->default_value(log_dir),
    "Directory for log files");

    // Parse arguments
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    // Show help message if requested
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    // Logging
    initialize_all_loggers(log_dir);
    auto log = get_logger(logger_tag::SHELL);
    log->info("connecting to {}:{} as '{}'", params.host, params.port, params.username);
    std::cout << "Connecting to:" << std::endl;
    std::cout << "Alias: " << params.alias << std::endl;
    std::cout << "Host: " << params.host << std::endl;
    std::cout << "Port: " << params.port << std::endl;
    std::cout << "Username: " << params.username << std::endl;
    std::cout << "Database: " << params.database << std::endl;

    std::unique_ptr<txnest::connection> conn;
    try {
        conn = std::make_unique<txnest::connection>(txnest::mysqlc::mysql_session_factory(params));
    } catch (const txnest::error& e) {
        std::cerr << "Failed to connect: " << e.what() << std::endl;
        return 1;
    }

    shell sh(*conn);
    std::string line;
    while (std::cout << conn->describe() << "> " << std::flush, std::getline(std::cin, line)) {
        try {
            if (!sh.handle(line)) {
                break;
            }
        } catch (const txnest::error& e) {
            log->error("{}", e.what());
            std::cout << "ERROR: " << e.what() << std::endl;
        } catch (const txnest::internal_error& e) {
            log->critical("{}", e.what());
            return 1;
        } catch (const std::invalid_argument& e) {
            std::cout << "ERROR: bad argument: " << e.what() << std::endl;
        } catch (const std::out_of_range& e) {
            std::cout << "ERROR: bad argument: " << e.what() << std::endl;
        }
    }

    try {
        sh.close();
    } catch (const txnest::error& e) {
        log->error("cleanup failed: {}", e.what());
        return 1;
    }
    return 0;
}

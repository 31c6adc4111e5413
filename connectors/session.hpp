// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "transaction/transaction_options.hpp"
#include "transaction/transaction_status.hpp"

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace txnest {

    namespace asio = boost::asio;

    struct command_result {
        std::size_t statements = 0;
        uint64_t affected_rows = 0;
    };

    struct cache_invalidation {
        bool cleared = false;
        std::vector<std::string> maintenance_commands{};
    };

    // Everything the transaction layer needs from the database session.
    class ISession {
    public:
        virtual ~ISession() = default;

        virtual std::string quote_identifier(std::string_view name) const = 0;

        // command opening an outer transaction with the given characteristics
        virtual std::string start_command(const transaction_characteristics& characteristics) const {
            return standard_start_command(characteristics);
        }

        // runs a "; "-joined batch as one round trip, throws operational_error on failure
        virtual asio::awaitable<command_result> execute(std::string batch) = 0;

        // runs a query through the server-side prepared statement cache
        virtual asio::awaitable<command_result> execute_prepared(std::string query) = 0;

        virtual transaction_status get_transaction_status() const noexcept = 0;

        // drops every cached prepared statement; called once per rollback
        virtual cache_invalidation invalidate_prepared_cache() = 0;

        // takes back maintenance commands handed out earlier when the batch carrying them failed
        virtual void requeue_maintenance(std::vector<std::string> commands) = 0;

        virtual std::string describe() const = 0;
    };

} // namespace txnest

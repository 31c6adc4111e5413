// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "transaction/transaction_options.hpp"

#include <catch2/catch.hpp>

using namespace txnest;

TEST_CASE("transaction_options: isolation level names") {
    REQUIRE(to_sql(isolation_level::READ_COMMITTED) == "READ COMMITTED");
    REQUIRE(parse_isolation_level("serializable") == isolation_level::SERIALIZABLE);
    REQUIRE(parse_isolation_level("repeatable_read") == isolation_level::REPEATABLE_READ);
    REQUIRE(parse_isolation_level("Read Uncommitted") == isolation_level::READ_UNCOMMITTED);
    REQUIRE(parse_isolation_level("read-committed") == isolation_level::READ_COMMITTED);
    REQUIRE_FALSE(parse_isolation_level("snapshot").has_value());
    REQUIRE_FALSE(parse_isolation_level("").has_value());
}

TEST_CASE("transaction_options: start command") {
    transaction_characteristics characteristics;
    REQUIRE(characteristics.empty());
    REQUIRE(standard_start_command(characteristics) == "BEGIN");

    characteristics.read_only = false;
    REQUIRE_FALSE(characteristics.empty());
    REQUIRE(standard_start_command(characteristics) == "BEGIN READ WRITE");

    characteristics.isolation = isolation_level::READ_COMMITTED;
    characteristics.deferrable = false;
    REQUIRE(standard_start_command(characteristics) == "BEGIN ISOLATION LEVEL READ COMMITTED READ WRITE NOT DEFERRABLE");
}

TEST_CASE("transaction_options: defaults") {
    transaction_options options;
    REQUIRE_FALSE(options.savepoint_name.has_value());
    REQUIRE_FALSE(options.force_rollback);
}

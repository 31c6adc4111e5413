// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "connectors/transaction_tracker.hpp"

#include <catch2/catch.hpp>

using namespace txnest;
using names_t = std::vector<std::string>;

TEST_CASE("transaction_tracker: split statements") {
    auto statements = split_statements(" BEGIN ;SAVEPOINT \"a;b\"; ; SELECT ';' ");
    REQUIRE(statements.size() == 3);
    REQUIRE(statements[0] == "BEGIN");
    REQUIRE(statements[1] == "SAVEPOINT \"a;b\"");
    REQUIRE(statements[2] == "SELECT ';'");
    REQUIRE(split_statements("").empty());
}

TEST_CASE("transaction_tracker: begin and commit") {
    transaction_tracker tracker;
    REQUIRE(tracker.get_transaction_status() == transaction_status::IDLE);

    tracker.observe("START TRANSACTION READ ONLY");
    REQUIRE(tracker.get_transaction_status() == transaction_status::IN_TRANSACTION);
    tracker.observe("SELECT 1");
    REQUIRE(tracker.get_transaction_status() == transaction_status::IN_TRANSACTION);
    tracker.observe("commit");
    REQUIRE(tracker.get_transaction_status() == transaction_status::IDLE);
}

TEST_CASE("transaction_tracker: savepoints") {
    transaction_tracker tracker;
    tracker.observe("BEGIN; SAVEPOINT \"x\"; SAVEPOINT `My Point`; SAVEPOINT y");
    REQUIRE(tracker.savepoints() == names_t{"x", "My Point", "y"});

    tracker.observe("ROLLBACK TO `My Point`");
    REQUIRE(tracker.savepoints() == names_t{"x", "My Point"});
    REQUIRE(tracker.get_transaction_status() == transaction_status::IN_TRANSACTION);

    tracker.observe("RELEASE SAVEPOINT \"x\"");
    REQUIRE(tracker.savepoints().empty());

    tracker.observe("ROLLBACK");
    REQUIRE(tracker.get_transaction_status() == transaction_status::IDLE);
}

TEST_CASE("transaction_tracker: rollback to savepoint recovers a failed transaction") {
    transaction_tracker tracker;
    tracker.observe("BEGIN; SAVEPOINT s");
    tracker.mark_failed();
    REQUIRE(tracker.get_transaction_status() == transaction_status::TRANSACTION_ERROR);

    tracker.observe("ROLLBACK WORK TO SAVEPOINT s");
    REQUIRE(tracker.get_transaction_status() == transaction_status::IN_TRANSACTION);
    REQUIRE(tracker.savepoints() == names_t{"s"});
}

TEST_CASE("transaction_tracker: unknown savepoint fails the transaction") {
    transaction_tracker tracker;
    tracker.observe("BEGIN");
    REQUIRE_FALSE(tracker.handle_release_savepoint("nope"));
    REQUIRE(tracker.get_transaction_status() == transaction_status::TRANSACTION_ERROR);

    // commit of a failed transaction ends it anyway
    REQUIRE_FALSE(tracker.handle_commit());
    REQUIRE(tracker.get_transaction_status() == transaction_status::IDLE);
}

TEST_CASE("transaction_tracker: failures") {
    transaction_tracker tracker;

    tracker.observe_failure("SELECT broken");
    REQUIRE(tracker.get_transaction_status() == transaction_status::IDLE);

    tracker.observe_failure("BEGIN; SELECT broken");
    REQUIRE(tracker.get_transaction_status() == transaction_status::TRANSACTION_ERROR);

    tracker.reset();
    tracker.observe("BEGIN");
    tracker.observe_failure("SELECT broken");
    REQUIRE(tracker.get_transaction_status() == transaction_status::TRANSACTION_ERROR);

    REQUIRE(tracker.handle_rollback());
    REQUIRE(tracker.get_transaction_status() == transaction_status::IDLE);
}

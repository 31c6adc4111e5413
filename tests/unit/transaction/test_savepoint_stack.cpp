// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "transaction/errors.hpp"
#include "transaction/savepoint_stack.hpp"

#include <catch2/catch.hpp>

using namespace txnest;

TEST_CASE("savepoint_stack: push and pop") {
    savepoint_stack stack;
    REQUIRE(stack.empty());

    stack.push("");
    stack.push("a");
    stack.push("b");
    REQUIRE(stack.size() == 3);
    REQUIRE(stack.top() == "b");
    REQUIRE(stack.contains("a"));
    REQUIRE(stack.contains(""));
    REQUIRE_FALSE(stack.contains("c"));
    REQUIRE(stack.names() == std::vector<std::string>{"", "a", "b"});

    REQUIRE(stack.pop() == "b");
    REQUIRE(stack.pop() == "a");
    REQUIRE(stack.pop() == "");
    REQUIRE(stack.empty());
}

TEST_CASE("savepoint_stack: empty stack") {
    savepoint_stack stack;
    REQUIRE_THROWS_AS(stack.pop(), internal_error);
    REQUIRE_THROWS_AS(stack.top(), internal_error);
}

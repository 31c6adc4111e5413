// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "connectors/async_connection.hpp"
#include "tests/mock/mock_session.hpp"
#include "transaction/errors.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>

#include <catch2/catch.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace txnest;
using namespace std::chrono_literals;
using batches_t = std::vector<std::string>;

namespace {
    struct fixture {
        explicit fixture(mock_config config = {}) {
            auto session = std::make_unique<mock_session>(std::move(config));
            mock = session.get();
            conn = std::make_unique<async_connection>(std::move(session));
        }

        template<typename T>
        T run(asio::awaitable<T> op) {
            auto result = asio::co_spawn(ctx, std::move(op), asio::use_future);
            ctx.run();
            ctx.restart();
            return result.get();
        }

        asio::io_context ctx;
        mock_session* mock = nullptr;
        std::unique_ptr<async_connection> conn;
    };

    asio::awaitable<void> nothing(async_transaction&) { co_return; }
} // namespace

TEST_CASE("async_transaction: nested commit") {
    fixture f;
    auto& conn = *f.conn;

    f.run([&]() -> asio::awaitable<void> {
        co_await conn.transaction([&](async_transaction& outer) -> asio::awaitable<void> {
            REQUIRE(outer.is_outer_transaction());
            co_await conn.transaction(
                [&](async_transaction& inner) -> asio::awaitable<void> {
                    REQUIRE(inner.savepoint_name() == "x");
                    co_await conn.execute("UPDATE t SET a = 1");
                },
                {.savepoint_name = "x"});
        });
    }());

    REQUIRE(f.mock->batches() ==
            batches_t{"BEGIN", "SAVEPOINT \"x\"", "UPDATE t SET a = 1", "RELEASE SAVEPOINT \"x\"", "COMMIT"});
    REQUIRE(conn.savepoints().empty());
}

TEST_CASE("async_transaction: error in nested block") {
    fixture f;
    auto& conn = *f.conn;

    auto op = [&]() -> asio::awaitable<void> {
        co_await conn.transaction([&](async_transaction&) -> asio::awaitable<void> {
            co_await conn.transaction(
                [](async_transaction&) -> asio::awaitable<void> {
                    throw std::runtime_error("boom");
                    co_return;
                },
                {.savepoint_name = "x"});
        });
    };

    REQUIRE_THROWS_WITH(f.run(op()), "boom");
    REQUIRE(f.mock->batches() ==
            batches_t{"BEGIN", "SAVEPOINT \"x\"", "ROLLBACK TO \"x\"; RELEASE SAVEPOINT \"x\"", "ROLLBACK"});
    REQUIRE(conn.savepoints().empty());
}

TEST_CASE("async_transaction: rollback signal to an ancestor") {
    fixture f;
    auto& conn = *f.conn;
    bool continued = false;

    f.run([&]() -> asio::awaitable<void> {
        co_await conn.transaction([&](async_transaction& outer) -> asio::awaitable<void> {
            co_await conn.transaction([&](async_transaction&) -> asio::awaitable<void> {
                throw rollback(outer);
                co_return;
            });
            continued = true;
        });
    }());

    REQUIRE_FALSE(continued);
    REQUIRE(f.mock->batches() ==
            batches_t{"BEGIN", "SAVEPOINT \"_tx_2\"", "ROLLBACK TO \"_tx_2\"; RELEASE SAVEPOINT \"_tx_2\"", "ROLLBACK"});
}

TEST_CASE("async_transaction: force rollback") {
    fixture f;
    f.run(f.conn->transaction(nothing, {.force_rollback = true}));
    REQUIRE(f.mock->batches() == batches_t{"BEGIN", "ROLLBACK"});
}

TEST_CASE("async_transaction: out of order exit") {
    fixture f;
    auto& conn = *f.conn;

    async_transaction a(conn);
    async_transaction b(conn, {.savepoint_name = "s1"});
    f.run(a.enter());
    f.run(b.enter());

    try {
        f.run(a.exit(outcome::completed()));
        FAIL("out_of_order_nesting expected");
    } catch (const out_of_order_nesting& e) {
        REQUIRE(e.expected().empty());
        REQUIRE(e.actual() == "s1");
    }
    REQUIRE_THROWS_AS(f.run(a.enter()), usage_error);
}

TEST_CASE("async_transaction: cancelled block is still rolled back") {
    fixture f(mock_config{.wait_time = 5ms});
    auto& conn = *f.conn;

    asio::cancellation_signal signal;
    std::exception_ptr error;
    bool done = false;

    asio::co_spawn(f.ctx,
                   conn.transaction([](async_transaction&) -> asio::awaitable<void> {
                       asio::steady_timer timer(co_await asio::this_coro::executor, std::chrono::seconds(30));
                       co_await timer.async_wait(asio::use_awaitable);
                   }),
                   asio::bind_cancellation_slot(signal.slot(), [&](std::exception_ptr e) {
                       error = e;
                       done = true;
                   }));

    asio::steady_timer trigger(f.ctx, 50ms);
    trigger.async_wait([&](boost::system::error_code) { signal.emit(asio::cancellation_type::terminal); });
    f.ctx.run();

    REQUIRE(done);
    REQUIRE(error != nullptr);
    try {
        std::rethrow_exception(error);
    } catch (const boost::system::system_error& e) {
        REQUIRE(e.code() == asio::error::operation_aborted);
    }
    REQUIRE(f.mock->batches() == batches_t{"BEGIN", "ROLLBACK"});
    REQUIRE(conn.savepoints().empty());
    REQUIRE(conn.get_transaction_status() == transaction_status::IDLE);
}

TEST_CASE("async_transaction: the lock serializes round trips") {
    fixture f(mock_config{.wait_time = 10ms});
    auto& conn = *f.conn;
    int finished = 0;

    auto work = [&](std::string name) -> asio::awaitable<void> {
        co_await conn.transaction(
            [&](async_transaction&) -> asio::awaitable<void> { co_await conn.execute("SELECT 1"); },
            {.savepoint_name = name});
        ++finished;
    };

    // plain statements and a transaction compete for the connection
    for (int i = 0; i < 4; ++i) {
        asio::co_spawn(f.ctx, conn.execute("SELECT " + std::to_string(i)), asio::detached);
    }
    asio::co_spawn(f.ctx, work("solo"), asio::detached);
    f.ctx.run();

    REQUIRE(finished == 1);
    REQUIRE(f.mock->max_in_flight() == 1);
    REQUIRE(conn.savepoints().empty());
    REQUIRE_FALSE(conn.lock().is_locked());
}

TEST_CASE("async_transaction: characteristics need an idle connection") {
    fixture f;
    auto& conn = *f.conn;

    f.run(conn.set_isolation_level(isolation_level::REPEATABLE_READ));
    f.run([&]() -> asio::awaitable<void> {
        co_await conn.transaction([&](async_transaction&) -> asio::awaitable<void> {
            bool rejected = false;
            try {
                co_await conn.set_isolation_level(std::nullopt);
            } catch (const usage_error&) {
                rejected = true;
            }
            REQUIRE(rejected);
        });
    }());

    REQUIRE(f.mock->batches().front() == "BEGIN ISOLATION LEVEL REPEATABLE READ");
}

TEST_CASE("async_transaction: rejected savepoint name leaves the connection usable") {
    fixture f;
    auto& conn = *f.conn;
    const std::string bad_name("a\0b", 3);

    REQUIRE_THROWS_AS(f.run(conn.transaction(nothing, {.savepoint_name = bad_name})), usage_error);
    REQUIRE(conn.savepoints().empty());
    REQUIRE(f.mock->batches().empty());
    REQUIRE_FALSE(conn.lock().is_locked());

    f.run(conn.transaction(nothing));
    REQUIRE(f.mock->batches() == batches_t{"BEGIN", "COMMIT"});
}

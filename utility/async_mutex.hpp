// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <utility>

namespace txnest {

    class async_mutex;

    class async_lock_guard {
    public:
        explicit async_lock_guard(async_mutex& mutex) noexcept
            : mutex_(&mutex) {}
        async_lock_guard(async_lock_guard&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr)) {}
        async_lock_guard& operator=(async_lock_guard&& other) noexcept;
        async_lock_guard(const async_lock_guard&) = delete;
        async_lock_guard& operator=(const async_lock_guard&) = delete;
        ~async_lock_guard();

        void unlock() noexcept;

    private:
        async_mutex* mutex_;
    };

    // Single-flight lock for coroutines sharing one executor. Waiters are
    // resumed in FIFO order, ownership is handed over directly on unlock.
    // Not thread-safe: all users must run on the same single-threaded context.
    class async_mutex {
    public:
        async_mutex() = default;
        async_mutex(const async_mutex&) = delete;
        async_mutex& operator=(const async_mutex&) = delete;

        boost::asio::awaitable<void> lock() {
            if (!locked_) {
                locked_ = true;
                co_return;
            }

            auto executor = co_await boost::asio::this_coro::executor;
            auto w = std::make_shared<waiter>(executor);
            waiters_.push_back(w);

            boost::system::error_code ec;
            co_await w->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (!w->granted) {
                // cancelled while queued
                std::erase(waiters_, w);
                throw boost::system::system_error(boost::asio::error::operation_aborted);
            }
        }

        boost::asio::awaitable<async_lock_guard> scoped_lock() {
            co_await lock();
            co_return async_lock_guard(*this);
        }

        bool try_lock() noexcept {
            if (locked_) {
                return false;
            }
            locked_ = true;
            return true;
        }

        void unlock() noexcept {
            if (waiters_.empty()) {
                locked_ = false;
                return;
            }
            auto next = std::move(waiters_.front());
            waiters_.pop_front();
            next->granted = true;
            next->timer.cancel();
        }

        bool is_locked() const noexcept { return locked_; }
        std::size_t waiting() const noexcept { return waiters_.size(); }

    private:
        struct waiter {
            explicit waiter(const boost::asio::any_io_executor& executor)
                : timer(executor, std::chrono::steady_clock::time_point::max()) {}
            boost::asio::steady_timer timer;
            bool granted = false;
        };

        bool locked_ = false;
        std::deque<std::shared_ptr<waiter>> waiters_;
    };

    inline async_lock_guard& async_lock_guard::operator=(async_lock_guard&& other) noexcept {
        if (this != &other) {
            unlock();
            mutex_ = std::exchange(other.mutex_, nullptr);
        }
        return *this;
    }

    inline async_lock_guard::~async_lock_guard() { unlock(); }

    inline void async_lock_guard::unlock() noexcept {
        if (mutex_) {
            std::exchange(mutex_, nullptr)->unlock();
        }
    }

} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <thread>

enum class io_thread_status
{
    CREATED,
    RUNNING,
    STOPPED
};

// single thread running an io_context; everything posted to it runs in order
class io_thread {
public:
    io_thread()
        : status_{io_thread_status::CREATED}
        , work_guard_(boost::asio::make_work_guard(ctx_)) {}

    io_thread(const io_thread&) = delete;
    io_thread& operator=(const io_thread&) = delete;

    boost::asio::io_context& ctx() { return ctx_; }

    io_thread_status status() const noexcept { return status_; }

    bool running_in_this_thread() noexcept { return ctx_.get_executor().running_in_this_thread(); }

    void start() {
        if (status_ == io_thread_status::RUNNING) {
            return;
        }
        thread_ = std::jthread([this]() { ctx_.run(); });
        status_ = io_thread_status::RUNNING;
    }

    void stop() {
        if (status_ != io_thread_status::RUNNING) {
            return;
        }
        work_guard_.reset();
        ctx_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
        status_ = io_thread_status::STOPPED;
    }

    ~io_thread() { stop(); }

private:
    boost::asio::io_context ctx_;
    io_thread_status status_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::jthread thread_;
};

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace txnest {

    class transaction_base;

    class error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // misuse of the API; fixing the calling code is the only remedy
    class programming_error : public error {
    public:
        using error::error;
    };

    class usage_error : public programming_error {
    public:
        using programming_error::programming_error;
    };

    // a scope was closed while another one sat on top of the savepoint stack
    class out_of_order_nesting : public programming_error {
    public:
        out_of_order_nesting(const std::string& message, std::string expected, std::string actual)
            : programming_error(message)
            , expected_(std::move(expected))
            , actual_(std::move(actual)) {}

        // savepoint name of the scope being exited
        const std::string& expected() const noexcept { return expected_; }
        // savepoint name found on top of the stack ("" for the top-level transaction)
        const std::string& actual() const noexcept { return actual_; }

    private:
        std::string expected_;
        std::string actual_;
    };

    // server or connection failure while running a command batch
    class operational_error : public error {
    public:
        explicit operational_error(const std::string& message, int code = 0)
            : error(message)
            , code_(code) {}

        int code() const noexcept { return code_; }

    private:
        int code_;
    };

    // broken invariant of the nesting model
    class internal_error : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /**
     * Control signal: leave the current transaction block and roll it back.
     *
     * Without a target only the innermost scope handles it. With a target the
     * signal unwinds every enclosing scope up to and including the target.
     */
    class rollback : public std::exception {
    public:
        rollback() noexcept = default;
        explicit rollback(const transaction_base& target) noexcept
            : target_(&target) {}

        const transaction_base* target() const noexcept { return target_; }

        const char* what() const noexcept override { return "explicit transaction rollback"; }

    private:
        const transaction_base* target_ = nullptr;
    };

} // namespace txnest

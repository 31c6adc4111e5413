// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "errors.hpp"

#include <exception>
#include <optional>
#include <string>
#include <variant>

namespace txnest {

    // How a transaction block ended: ran to completion, or a signal escaped it.
    class outcome {
    public:
        struct completed_t {};

        static outcome completed() noexcept { return outcome(completed_t{}); }
        static outcome signaled(std::exception_ptr signal) noexcept { return outcome(std::move(signal)); }

        bool is_completed() const noexcept { return std::holds_alternative<completed_t>(value_); }

        // nullptr when completed
        std::exception_ptr signal() const noexcept {
            if (auto* ptr = std::get_if<std::exception_ptr>(&value_)) {
                return *ptr;
            }
            return nullptr;
        }

        // copy of the rollback signal if that is what escaped the block
        std::optional<rollback> as_rollback() const {
            auto ptr = signal();
            if (!ptr) {
                return std::nullopt;
            }
            try {
                std::rethrow_exception(ptr);
            } catch (const rollback& signal) {
                return signal;
            } catch (...) {
                return std::nullopt;
            }
        }

        std::string describe() const {
            auto ptr = signal();
            if (!ptr) {
                return "completed";
            }
            try {
                std::rethrow_exception(ptr);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "unknown signal";
            }
        }

    private:
        explicit outcome(completed_t value) noexcept
            : value_(value) {}
        explicit outcome(std::exception_ptr signal) noexcept
            : value_(std::move(signal)) {}

        std::variant<completed_t, std::exception_ptr> value_;
    };

} // namespace txnest

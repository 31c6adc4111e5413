// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace cv_wrapper {
    enum class Status : uint8_t
    {
        Ok,
        Error,
        Unknown
    };

    // one-shot hand-off of a value or an exception from the io thread to a blocked caller
    template<typename T>
    class cv_wrapper_t {
    public:
        void wait() {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait(lock, [this]() { return ready_; });
        }

        void release(T value) {
            {
                std::unique_lock<std::mutex> lock(m_);
                result_.emplace(std::move(value));
                ready_ = true;
                status_ = Status::Ok;
            }
            cv_.notify_one();
        }

        void release_on_error(std::exception_ptr error) {
            {
                std::unique_lock<std::mutex> lock(m_);
                error_ = std::move(error);
                ready_ = true;
                status_ = Status::Error;
            }
            cv_.notify_one();
        }

        Status status() const noexcept {
            std::unique_lock<std::mutex> lock(m_);
            return status_;
        }

        // waits, then returns the value or rethrows the original exception
        T get() {
            wait();
            std::unique_lock<std::mutex> lock(m_);
            if (status_ == Status::Error) {
                std::rethrow_exception(error_);
            }
            if (!result_) {
                throw std::logic_error("cv_wrapper: result already taken");
            }
            T value = std::move(*result_);
            result_.reset();
            return value;
        }

    private:
        Status status_{Status::Unknown};
        std::optional<T> result_{std::nullopt};
        std::exception_ptr error_{nullptr};
        bool ready_{false};
        mutable std::mutex m_;
        std::condition_variable cv_;
    };
} // namespace cv_wrapper

template<typename T>
inline std::shared_ptr<cv_wrapper::cv_wrapper_t<T>> create_cv_wrapper() {
    return std::make_shared<cv_wrapper::cv_wrapper_t<T>>();
}
template<typename T>
using shared_data = std::shared_ptr<cv_wrapper::cv_wrapper_t<T>>;

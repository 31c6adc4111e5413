// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <string_view>

namespace txnest {
    enum class transaction_status : char
    {
        IDLE = 'I',
        IN_TRANSACTION = 'T',
        TRANSACTION_ERROR = 'E',
    };

    inline std::string_view to_string(transaction_status status) noexcept {
        switch (status) {
            case transaction_status::IDLE:
                return "idle";
            case transaction_status::IN_TRANSACTION:
                return "in transaction";
            case transaction_status::TRANSACTION_ERROR:
                return "in failed transaction";
        }
        return "unknown";
    }
} // namespace txnest

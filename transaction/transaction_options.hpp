// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace txnest {

    // Per-scope options, fixed at construction.
    struct transaction_options {
        // empty or unset: anonymous; inner scopes then get a generated name on entry
        std::optional<std::string> savepoint_name = std::nullopt;
        // roll back on exit even when the block completes normally
        bool force_rollback = false;
    };

    enum class isolation_level : uint8_t
    {
        READ_UNCOMMITTED,
        READ_COMMITTED,
        REPEATABLE_READ,
        SERIALIZABLE,
    };

    std::string_view to_sql(isolation_level level) noexcept;
    std::optional<isolation_level> parse_isolation_level(std::string_view text);

    // Per-connection characteristics applied when an outer transaction starts.
    struct transaction_characteristics {
        std::optional<isolation_level> isolation = std::nullopt;
        std::optional<bool> read_only = std::nullopt;
        std::optional<bool> deferrable = std::nullopt;

        bool empty() const noexcept { return !isolation && !read_only && !deferrable; }
    };

    // BEGIN [ISOLATION LEVEL ...] [READ ONLY | READ WRITE] [DEFERRABLE | NOT DEFERRABLE]
    std::string standard_start_command(const transaction_characteristics& characteristics);

} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "transaction_options.hpp"

#include <algorithm>
#include <cctype>

namespace txnest {
    std::string_view to_sql(isolation_level level) noexcept {
        switch (level) {
            case isolation_level::READ_UNCOMMITTED:
                return "READ UNCOMMITTED";
            case isolation_level::READ_COMMITTED:
                return "READ COMMITTED";
            case isolation_level::REPEATABLE_READ:
                return "REPEATABLE READ";
            case isolation_level::SERIALIZABLE:
                return "SERIALIZABLE";
        }
        return "";
    }

    std::optional<isolation_level> parse_isolation_level(std::string_view text) {
        std::string normalized;
        normalized.reserve(text.size());
        for (char c : text) {
            normalized += (c == '_' || c == '-') ? ' ' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        for (auto level : {isolation_level::READ_UNCOMMITTED,
                           isolation_level::READ_COMMITTED,
                           isolation_level::REPEATABLE_READ,
                           isolation_level::SERIALIZABLE}) {
            if (normalized == to_sql(level)) {
                return level;
            }
        }
        return std::nullopt;
    }

    std::string standard_start_command(const transaction_characteristics& characteristics) {
        std::string command = "BEGIN";
        if (characteristics.isolation) {
            command += " ISOLATION LEVEL ";
            command += to_sql(*characteristics.isolation);
        }
        if (characteristics.read_only) {
            command += *characteristics.read_only ? " READ ONLY" : " READ WRITE";
        }
        if (characteristics.deferrable) {
            command += *characteristics.deferrable ? " DEFERRABLE" : " NOT DEFERRABLE";
        }
        return command;
    }
} // namespace txnest

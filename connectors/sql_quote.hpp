// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <string>
#include <string_view>

namespace txnest::sql {
    inline constexpr char ANSI_QUOTE = '"';
    inline constexpr char MYSQL_QUOTE = '`';

    // wraps `name` in `quote`, doubling embedded quotes; NUL bytes are rejected
    std::string quote_identifier(std::string_view name, char quote = ANSI_QUOTE);

    // single-quoted string literal; backslashes are escaped when the server treats them as escapes
    std::string quote_literal(std::string_view text, bool backslash_escapes = false);
} // namespace txnest::sql

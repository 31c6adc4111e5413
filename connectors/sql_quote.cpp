// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "sql_quote.hpp"
#include "transaction/errors.hpp"

namespace txnest::sql {
    std::string quote_identifier(std::string_view name, char quote) {
        if (name.empty()) {
            throw usage_error("empty identifier");
        }

        std::string result;
        result.reserve(name.size() + 2);
        result += quote;
        for (char c : name) {
            if (c == '\0') {
                throw usage_error("identifier contains a NUL byte");
            }
            if (c == quote) {
                result += quote;
            }
            result += c;
        }
        result += quote;
        return result;
    }

    std::string quote_literal(std::string_view text, bool backslash_escapes) {
        std::string result;
        result.reserve(text.size() + 2);
        result += '\'';
        for (char c : text) {
            if (c == '\0') {
                throw usage_error("string literal contains a NUL byte");
            }
            if (c == '\'') {
                result += '\'';
            } else if (c == '\\' && backslash_escapes) {
                result += '\\';
            }
            result += c;
        }
        result += '\'';
        return result;
    }
} // namespace txnest::sql

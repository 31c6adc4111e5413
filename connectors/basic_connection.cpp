// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "basic_connection.hpp"
#include "transaction/errors.hpp"

#include <fmt/format.h>

namespace txnest {
    basic_connection::basic_connection(log_t log)
        : log_(log ? std::move(log) : get_logger(logger_tag::CONNECTION)) {}

    std::string basic_connection::describe() const {
        return fmt::format("{} ({})", session().describe(), to_string(session().get_transaction_status()));
    }

    void basic_connection::check_idle(std::string_view what) const {
        auto status = session().get_transaction_status();
        if (status != transaction_status::IDLE) {
            throw usage_error(fmt::format("can't change {} now: connection {}", what, to_string(status)));
        }
    }

    void basic_connection::apply_isolation_level(std::optional<isolation_level> level) {
        check_idle("isolation_level");
        characteristics_.isolation = level;
        log_->debug("{}: isolation level set to {}", session().describe(), level ? to_sql(*level) : "default");
    }

    void basic_connection::apply_read_only(std::optional<bool> read_only) {
        check_idle("read_only");
        characteristics_.read_only = read_only;
    }

    void basic_connection::apply_deferrable(std::optional<bool> deferrable) {
        check_idle("deferrable");
        characteristics_.deferrable = deferrable;
    }
} // namespace txnest

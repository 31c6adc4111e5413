// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "transaction_base.hpp"
#include "connectors/basic_connection.hpp"
#include "errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>

namespace txnest {
    namespace {
        constexpr std::string_view generated_name_prefix = "_tx_";
        constexpr std::string_view separator = "; ";
    } // namespace

    std::string_view to_string(transaction_state state) noexcept {
        switch (state) {
            case transaction_state::INACTIVE:
                return "inactive";
            case transaction_state::ACTIVE:
                return "active";
            case transaction_state::TERMINATED:
                return "terminated";
        }
        return "unknown";
    }

    transaction_base::transaction_base(basic_connection& conn, transaction_options options)
        : conn_(conn)
        , savepoint_name_(options.savepoint_name.value_or(""))
        , force_rollback_(options.force_rollback) {}

    transaction_state transaction_base::state() const noexcept {
        if (!entered_) {
            return transaction_state::INACTIVE;
        }
        return exited_ ? transaction_state::TERMINATED : transaction_state::ACTIVE;
    }

    std::string transaction_base::describe() const {
        auto name = savepoint_name_.empty() ? std::string() : fmt::format("'{}' ", savepoint_name_);
        return fmt::format("<transaction {}({}) {}>", name, to_string(state()), conn_.describe());
    }

    std::string transaction_base::join(const std::vector<std::string>& commands) {
        std::string batch;
        for (const auto& command : commands) {
            if (!batch.empty()) {
                batch += separator;
            }
            batch += command;
        }
        return batch;
    }

    bool transaction_base::commits(const outcome& result) const noexcept {
        return result.is_completed() && !force_rollback_;
    }

    std::vector<std::string> transaction_base::enter_commands() {
        if (entered_) {
            throw usage_error("transaction blocks can be used only once");
        }

        auto& session = conn_.session();
        bool outer = session.get_transaction_status() == transaction_status::IDLE;
        auto name = plan_savepoint(outer);

        // quoting and the start command may still reject the scope, nothing is touched until they pass
        std::vector<std::string> commands;
        if (outer) {
            commands.emplace_back(session.start_command(conn_.characteristics()));
        }
        if (!name.empty()) {
            commands.emplace_back("SAVEPOINT " + session.quote_identifier(name));
        }

        entered_ = true;
        outer_transaction_ = outer;
        savepoint_name_ = std::move(name);
        conn_.savepoints().push(savepoint_name_);
        return commands;
    }

    std::vector<std::string> transaction_base::commit_commands() {
        pop_savepoint("commit");

        std::vector<std::string> commands;
        if (!savepoint_name_.empty() && !outer_transaction_) {
            commands.emplace_back("RELEASE SAVEPOINT " + conn_.session().quote_identifier(savepoint_name_));
        }
        if (outer_transaction_) {
            if (!conn_.savepoints().empty()) {
                conn_.log()->critical("{}: savepoints left open at commit", describe());
                throw internal_error("savepoint stack not empty when committing the outer transaction");
            }
            commands.emplace_back("COMMIT");
        }
        return commands;
    }

    std::vector<std::string> transaction_base::rollback_commands(const outcome& result) {
        if (result.as_rollback()) {
            conn_.log()->debug("{}: explicit rollback from: {}", conn_.describe(), describe());
        }

        pop_savepoint("roll back");

        auto& session = conn_.session();
        std::vector<std::string> commands;
        if (!savepoint_name_.empty() && !outer_transaction_) {
            auto name = session.quote_identifier(savepoint_name_);
            commands.emplace_back(fmt::format("ROLLBACK TO {0}; RELEASE SAVEPOINT {0}", name));
        }
        if (outer_transaction_) {
            if (!conn_.savepoints().empty()) {
                conn_.log()->critical("{}: savepoints left open at rollback", describe());
                throw internal_error("savepoint stack not empty when rolling back the outer transaction");
            }
            commands.emplace_back("ROLLBACK");
        }

        // server-side plans may belong to the discarded work
        auto invalidation = session.invalidate_prepared_cache();
        if (invalidation.cleared) {
            commands.insert(commands.end(),
                            invalidation.maintenance_commands.begin(),
                            invalidation.maintenance_commands.end());
            maintenance_ = std::move(invalidation.maintenance_commands);
        }
        return commands;
    }

    void transaction_base::rollback_failed() {
        if (!maintenance_.empty()) {
            conn_.session().requeue_maintenance(std::exchange(maintenance_, {}));
        }
    }

    bool transaction_base::swallows(const outcome& result) const {
        auto signal = result.as_rollback();
        if (!signal) {
            return false;
        }
        return signal->target() == nullptr || signal->target() == this;
    }

    void transaction_base::abandon_entry() noexcept {
        auto& stack = conn_.savepoints();
        if (!stack.empty() && stack.top() == savepoint_name_) {
            stack.pop();
        }
        exited_ = true;
    }

    void transaction_base::check_exit() const {
        if (!entered_) {
            throw usage_error("transaction block exited without being entered");
        }
        if (exited_) {
            throw usage_error("transaction block already exited");
        }
    }

    std::string transaction_base::plan_savepoint(bool outer) const {
        const auto& stack = conn_.savepoints();
        if (outer) {
            // outer transaction: if no name it's only a begin, else there will be an additional savepoint
            if (!stack.empty()) {
                conn_.log()->critical("{}: connection idle with savepoints open: {}",
                                      describe(),
                                      fmt::join(stack.names(), ", "));
                throw internal_error("savepoint stack not empty while the connection is idle");
            }
            return savepoint_name_;
        }
        // inner transaction: it always has a name
        return savepoint_name_.empty() ? generate_name() : savepoint_name_;
    }

    void transaction_base::pop_savepoint(std::string_view action) {
        auto actual = conn_.savepoints().pop();
        exited_ = true;
        if (actual == savepoint_name_) {
            return;
        }

        auto other = actual.empty() ? std::string("the top-level transaction")
                                    : fmt::format("the savepoint '{}'", actual);
        throw out_of_order_nesting(fmt::format("transactions not correctly nested: {} would {} in the wrong order "
                                               "compared to {}",
                                               describe(),
                                               action,
                                               other),
                                   savepoint_name_,
                                   std::move(actual));
    }

    std::string transaction_base::generate_name() const {
        const auto& stack = conn_.savepoints();
        auto depth = stack.size() + 1;
        auto name = fmt::format("{}{}", generated_name_prefix, depth);
        // an explicit name further down may already use the depth-based one
        while (stack.contains(name)) {
            name = fmt::format("{}{}", generated_name_prefix, ++depth);
        }
        return name;
    }
} // namespace txnest

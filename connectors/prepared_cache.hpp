// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace txnest {

    struct prepared_plan {
        std::string name;
        // the statement is not on the server yet and must be prepared first
        bool needs_prepare = false;
    };

    // LRU of server-side prepared statements keyed by query text. Evicted and
    // invalidated statements are deallocated lazily, through the commands
    // returned by maintenance_commands().
    class prepared_cache {
    public:
        explicit prepared_cache(std::size_t max_size = 100);

        // existing statement for `query`, or a fresh name to prepare it under
        prepared_plan plan(std::string_view query);

        // forget a statement whose PREPARE failed on the server
        void discard(std::string_view query);

        // drops every statement; false when there was nothing to drop
        bool clear();

        // DEALLOCATE PREPARE commands for everything dropped so far; drains the backlog
        std::vector<std::string> maintenance_commands();

        // puts back commands taken by maintenance_commands() whose batch failed
        void requeue(std::vector<std::string> commands);

        std::size_t size() const noexcept;
        std::size_t max_size() const noexcept;

    private:
        using lru_list = std::list<std::pair<std::string, std::string>>;

        std::size_t max_size_;
        uint64_t counter_ = 0;
        lru_list entries_{};
        std::unordered_map<std::string_view, lru_list::iterator> index_{};
        // pending DEALLOCATE PREPARE commands, oldest first
        std::vector<std::string> to_deallocate_{};
    };

} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "prepared_cache.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace txnest {
    prepared_cache::prepared_cache(std::size_t max_size)
        : max_size_(max_size == 0 ? 1 : max_size) {}

    prepared_plan prepared_cache::plan(std::string_view query) {
        if (auto it = index_.find(query); it != index_.end()) {
            entries_.splice(entries_.begin(), entries_, it->second);
            return {it->second->second, false};
        }

        if (entries_.size() >= max_size_) {
            auto& oldest = entries_.back();
            to_deallocate_.push_back("DEALLOCATE PREPARE " + oldest.second);
            index_.erase(oldest.first);
            entries_.pop_back();
        }

        auto name = fmt::format("_txnest_ps_{}", ++counter_);
        entries_.emplace_front(std::string(query), name);
        // the key views the query owned by the list node
        index_.emplace(entries_.front().first, entries_.begin());
        return {std::move(name), true};
    }

    void prepared_cache::discard(std::string_view query) {
        if (auto it = index_.find(query); it != index_.end()) {
            auto node = it->second;
            index_.erase(it);
            entries_.erase(node);
        }
    }

    bool prepared_cache::clear() {
        if (entries_.empty() && to_deallocate_.empty()) {
            return false;
        }
        for (const auto& entry : entries_) {
            to_deallocate_.push_back("DEALLOCATE PREPARE " + entry.second);
        }
        index_.clear();
        entries_.clear();
        return true;
    }

    std::vector<std::string> prepared_cache::maintenance_commands() { return std::exchange(to_deallocate_, {}); }

    void prepared_cache::requeue(std::vector<std::string> commands) {
        to_deallocate_.insert(to_deallocate_.begin(),
                              std::make_move_iterator(commands.begin()),
                              std::make_move_iterator(commands.end()));
    }

    std::size_t prepared_cache::size() const noexcept { return entries_.size(); }

    std::size_t prepared_cache::max_size() const noexcept { return max_size_; }
} // namespace txnest

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "transaction_tracker.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace txnest {
    namespace {
        bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

        bool is_quote(char c) { return c == '\'' || c == '"' || c == '`'; }

        bool is_word(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$'; }

        // index past the closing quote; doubled quotes stay inside the token
        std::size_t skip_quoted(std::string_view text, std::size_t pos) {
            char quote = text[pos++];
            while (pos < text.size()) {
                if (text[pos] == quote) {
                    if (pos + 1 < text.size() && text[pos + 1] == quote) {
                        pos += 2;
                        continue;
                    }
                    return pos + 1;
                }
                ++pos;
            }
            return pos;
        }

        std::string_view trim(std::string_view text) {
            while (!text.empty() && is_space(text.front())) {
                text.remove_prefix(1);
            }
            while (!text.empty() && is_space(text.back())) {
                text.remove_suffix(1);
            }
            return text;
        }

        // words upper-cased, quoted identifiers unquoted, unquoted identifiers lower-cased
        class statement_tokens {
        public:
            explicit statement_tokens(std::string_view statement) {
                std::size_t pos = 0;
                while (pos < statement.size()) {
                    char c = statement[pos];
                    if (is_space(c)) {
                        ++pos;
                    } else if (is_quote(c)) {
                        auto end = skip_quoted(statement, pos);
                        words_.push_back({unquote(statement.substr(pos, end - pos)), true});
                        pos = end;
                    } else if (is_word(c)) {
                        auto end = pos;
                        while (end < statement.size() && is_word(statement[end])) {
                            ++end;
                        }
                        words_.push_back({std::string(statement.substr(pos, end - pos)), false});
                        pos = end;
                    } else {
                        words_.push_back({std::string(1, c), false});
                        ++pos;
                    }
                }
            }

            // keyword at `index`, empty when missing or quoted
            std::string keyword(std::size_t index) const {
                if (index >= words_.size() || words_[index].quoted) {
                    return {};
                }
                std::string word = words_[index].text;
                std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
                    return static_cast<char>(std::toupper(c));
                });
                return word;
            }

            std::string name(std::size_t index) const {
                if (index >= words_.size()) {
                    return {};
                }
                if (words_[index].quoted) {
                    return words_[index].text;
                }
                std::string word = words_[index].text;
                std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
                    return static_cast<char>(std::tolower(c));
                });
                return word;
            }

        private:
            struct word {
                std::string text;
                bool quoted;
            };

            static std::string unquote(std::string_view token) {
                char quote = token.front();
                token.remove_prefix(1);
                if (!token.empty() && token.back() == quote) {
                    token.remove_suffix(1);
                }
                std::string result;
                for (std::size_t i = 0; i < token.size(); ++i) {
                    result += token[i];
                    if (token[i] == quote && i + 1 < token.size() && token[i + 1] == quote) {
                        ++i;
                    }
                }
                return result;
            }

            std::vector<word> words_;
        };
    } // namespace

    std::vector<std::string_view> split_statements(std::string_view batch) {
        std::vector<std::string_view> statements;
        std::size_t start = 0;
        std::size_t pos = 0;
        while (pos < batch.size()) {
            if (is_quote(batch[pos])) {
                pos = skip_quoted(batch, pos);
            } else if (batch[pos] == ';') {
                if (auto statement = trim(batch.substr(start, pos - start)); !statement.empty()) {
                    statements.push_back(statement);
                }
                start = ++pos;
            } else {
                ++pos;
            }
        }
        if (auto statement = trim(batch.substr(start)); !statement.empty()) {
            statements.push_back(statement);
        }
        return statements;
    }

    void transaction_tracker::observe(std::string_view batch) {
        for (auto statement : split_statements(batch)) {
            statement_tokens tokens(statement);
            auto first = tokens.keyword(0);

            if (first == "BEGIN" || (first == "START" && tokens.keyword(1) == "TRANSACTION")) {
                handle_begin();
            } else if (first == "COMMIT" || first == "END") {
                handle_commit();
            } else if (first == "ROLLBACK" || first == "ABORT") {
                std::size_t next = tokens.keyword(1) == "WORK" ? 2 : 1;
                if (tokens.keyword(next) != "TO") {
                    handle_rollback();
                    continue;
                }
                ++next;
                if (tokens.keyword(next) == "SAVEPOINT") {
                    ++next;
                }
                handle_rollback_to_savepoint(tokens.name(next));
            } else if (first == "SAVEPOINT") {
                handle_savepoint(tokens.name(1));
            } else if (first == "RELEASE") {
                std::size_t next = tokens.keyword(1) == "SAVEPOINT" ? 2 : 1;
                handle_release_savepoint(tokens.name(next));
            }
        }
    }

    void transaction_tracker::observe_failure(std::string_view batch) {
        if (state_ != transaction_status::IDLE) {
            mark_failed();
            return;
        }
        // a BEGIN may have gone through before the failure
        for (auto statement : split_statements(batch)) {
            statement_tokens tokens(statement);
            auto first = tokens.keyword(0);
            if (first == "BEGIN" || (first == "START" && tokens.keyword(1) == "TRANSACTION")) {
                mark_failed();
                return;
            }
        }
    }

    bool transaction_tracker::handle_begin() {
        if (state_ != transaction_status::IDLE) {
            state_ = transaction_status::TRANSACTION_ERROR;
            return false;
        }
        state_ = transaction_status::IN_TRANSACTION;
        return true;
    }

    bool transaction_tracker::handle_commit() {
        // a commit of a failed transaction rolls it back, either way the session is idle afterwards
        bool committed = state_ != transaction_status::TRANSACTION_ERROR;
        state_ = transaction_status::IDLE;
        savepoints_.clear();
        return committed;
    }

    bool transaction_tracker::handle_rollback() {
        state_ = transaction_status::IDLE;
        savepoints_.clear();
        return true;
    }

    bool transaction_tracker::handle_savepoint(std::string name) {
        if (state_ != transaction_status::IN_TRANSACTION) {
            return false;
        }
        savepoints_.emplace_back(std::move(name));
        return true;
    }

    bool transaction_tracker::handle_rollback_to_savepoint(const std::string& name) {
        if (state_ == transaction_status::IDLE) {
            return false;
        }

        // the most recent savepoint with that name wins
        auto it = std::find(savepoints_.rbegin(), savepoints_.rend(), name);
        if (it == savepoints_.rend()) {
            state_ = transaction_status::TRANSACTION_ERROR;
            return false;
        }

        // rollback: erase all savepoints after
        savepoints_.erase(it.base(), savepoints_.end());
        state_ = transaction_status::IN_TRANSACTION;
        return true;
    }

    bool transaction_tracker::handle_release_savepoint(const std::string& name) {
        if (state_ != transaction_status::IN_TRANSACTION) {
            return false;
        }

        auto it = std::find(savepoints_.rbegin(), savepoints_.rend(), name);
        if (it == savepoints_.rend()) {
            state_ = transaction_status::TRANSACTION_ERROR;
            return false;
        }

        // erase the savepoint and all after it
        savepoints_.erase(std::prev(it.base()), savepoints_.end());
        return true;
    }

    transaction_status transaction_tracker::get_transaction_status() const { return state_; }

    const std::vector<std::string>& transaction_tracker::savepoints() const { return savepoints_; }

    void transaction_tracker::mark_failed() { state_ = transaction_status::TRANSACTION_ERROR; }

    void transaction_tracker::reset() {
        state_ = transaction_status::IDLE;
        savepoints_.clear();
    }
} // namespace txnest

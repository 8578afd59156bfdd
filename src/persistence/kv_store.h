/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace loom {
    namespace persist {

        struct KvPair {
            std::string key;
            std::string value;
        };

        /**
         * A batch of preconditions and mutations committed atomically.
         *
         * Preconditions are evaluated against committed state at commit time,
         * under the store's write lock. If any fails, its failure action runs
         * (and is expected to throw); nothing in the batch is applied. This is
         * the primitive every epoch fence, compare-and-set and dedupe check in
         * the runtime is built from.
         */
        class Transaction {
        public:
            // current is nullptr when the key is absent
            using Predicate = std::function<bool(const std::string* current)>;
            using Failure = std::function<void(const std::string& key, const std::string* current)>;

            struct Check {
                std::string key;
                Predicate predicate;
                Failure on_failure;  // may be empty: CommitConflictError
            };

            struct Mutation {
                std::string key;
                std::string value;
                bool erase;
            };

            void expect(const std::string& key, Predicate predicate, Failure on_failure = Failure()) {
                checks_.push_back(Check{key, std::move(predicate), std::move(on_failure)});
            }

            void expect_absent(const std::string& key) {
                expect(key, [](const std::string* cur) { return cur == nullptr; });
            }

            void expect_present(const std::string& key) {
                expect(key, [](const std::string* cur) { return cur != nullptr; });
            }

            void expect_value(const std::string& key, const std::string& value) {
                expect(key, [value](const std::string* cur) { return cur && *cur == value; });
            }

            // Compare-and-set helper: absent when observed is nullptr
            void expect_unchanged(const std::string& key, const std::string* observed) {
                if (observed) expect_value(key, *observed);
                else expect_absent(key);
            }

            void put(const std::string& key, const std::string& value) {
                mutations_.push_back(Mutation{key, value, false});
            }

            void erase(const std::string& key) {
                mutations_.push_back(Mutation{key, std::string(), true});
            }

            /**
             * Latest staged mutation for key. Returns false if this transaction
             * does not touch the key; otherwise *erased tells whether the last
             * mutation was an erase.
             */
            bool staged(const std::string& key, std::string* value, bool* erased) const {
                for (auto it = mutations_.rbegin(); it != mutations_.rend(); ++it) {
                    if (it->key == key) {
                        if (value) *value = it->value;
                        if (erased) *erased = it->erase;
                        return true;
                    }
                }
                return false;
            }

            const std::vector<Check>& checks() const { return checks_; }
            const std::vector<Mutation>& mutations() const { return mutations_; }
            bool empty() const { return mutations_.empty(); }

        private:
            std::vector<Check> checks_;
            std::vector<Mutation> mutations_;
        };

        /**
         * Ordered, transactional key/value store shared by every runtime
         * component. Keys are compared bytewise; scans return keys in order.
         */
        class KvStore {
        public:
            virtual ~KvStore() = default;

            virtual bool get(const std::string& key, std::string* value) const = 0;

            // All pairs whose key starts with prefix, in key order; limit 0 = unbounded
            virtual std::vector<KvPair> scan(const std::string& prefix, size_t limit = 0) const = 0;

            // Pairs with prefix and key >= start, in key order
            virtual std::vector<KvPair> scan_from(const std::string& prefix, const std::string& start,
                                                  size_t limit = 0) const = 0;

            virtual void commit(const Transaction& txn) = 0;

            // Force buffered commits to stable storage (no-op for memory stores)
            virtual void sync() {}
        };

    } // namespace persist
} // namespace loom

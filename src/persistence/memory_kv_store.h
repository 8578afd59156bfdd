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
#include "kv_store.h"
#include <atomic>
#include <map>
#include <shared_mutex>

namespace loom {
    namespace persist {

        class MemoryKvStore : public KvStore {
        public:
            MemoryKvStore() = default;
            ~MemoryKvStore() override = default;

            bool get(const std::string& key, std::string* value) const override;
            std::vector<KvPair> scan(const std::string& prefix, size_t limit = 0) const override;
            std::vector<KvPair> scan_from(const std::string& prefix, const std::string& start,
                                          size_t limit = 0) const override;
            void commit(const Transaction& txn) override;

            size_t size() const;
            uint64_t commit_count() const { return commits_.load(std::memory_order_relaxed); }

        protected:
            // Called with the write lock held, after every precondition passed
            // and before the mutations become visible. Throwing aborts the commit.
            virtual void on_commit_locked(const Transaction&) {}

            // Direct access for recovery; caller holds no lock and no readers exist yet
            void apply_unlocked(const Transaction::Mutation& m);
            void clear_unlocked() { table_.clear(); }
            const std::map<std::string, std::string>& table_unlocked() const { return table_; }

            mutable std::shared_mutex mutex_;

        private:
            std::map<std::string, std::string> table_;
            std::atomic<uint64_t> commits_{0};
        };
    }
}

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

#include "memory_kv_store.h"
#include "../core/error.h"
#include <mutex>

namespace loom {
    namespace persist {

        bool MemoryKvStore::get(const std::string& key, std::string* value) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = table_.find(key);
            if (it == table_.end()) return false;
            if (value) *value = it->second;
            return true;
        }

        std::vector<KvPair> MemoryKvStore::scan(const std::string& prefix, size_t limit) const {
            return scan_from(prefix, prefix, limit);
        }

        std::vector<KvPair> MemoryKvStore::scan_from(const std::string& prefix, const std::string& start,
                                                     size_t limit) const {
            std::vector<KvPair> out;
            std::shared_lock<std::shared_mutex> lock(mutex_);
            const std::string& lower = start < prefix ? prefix : start;
            for (auto it = table_.lower_bound(lower); it != table_.end(); ++it) {
                if (it->first.compare(0, prefix.size(), prefix) != 0) break;
                out.push_back(KvPair{it->first, it->second});
                if (limit && out.size() >= limit) break;
            }
            return out;
        }

        void MemoryKvStore::commit(const Transaction& txn) {
            std::unique_lock<std::shared_mutex> lock(mutex_);

            for (const auto& check : txn.checks()) {
                auto it = table_.find(check.key);
                const std::string* current = (it == table_.end()) ? nullptr : &it->second;
                if (check.predicate(current)) continue;
                if (check.on_failure) {
                    check.on_failure(check.key, current);
                }
                throw CommitConflictError(check.key);
            }

            if (txn.empty()) return;

            on_commit_locked(txn);

            for (const auto& m : txn.mutations()) {
                apply_unlocked(m);
            }
            commits_.fetch_add(1, std::memory_order_relaxed);
        }

        void MemoryKvStore::apply_unlocked(const Transaction::Mutation& m) {
            if (m.erase) {
                table_.erase(m.key);
            } else {
                table_[m.key] = m.value;
            }
        }

        size_t MemoryKvStore::size() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return table_.size();
        }

    }
}

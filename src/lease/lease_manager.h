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

#include <cstdint>
#include <string>
#include "../core/clock.h"
#include "../persistence/kv_store.h"

namespace loom {

struct LeaseRecord {
    std::string holder;          // empty once released
    uint64_t epoch = 0;
    uint64_t expires_at_ns = 0;

    bool live(uint64_t now_ns) const { return !holder.empty() && expires_at_ns > now_ns; }

    std::string encode() const;
    static LeaseRecord decode(const std::string& bytes);
};

struct LeaseGrant {
    bool granted = false;
    uint64_t epoch = 0;
    LeaseRecord current;   // record after the attempt
};

/**
 * Epoch-fenced single-writer assignment of a world to a worker.
 *
 * The lease lives in the shared store at world/<id>/lease. Every mutating
 * call elsewhere adds fence() to its transaction, so a writer that lost
 * its lease is rejected by the store itself, whether or not it has
 * noticed yet.
 */
class LeaseManager {
public:
    LeaseManager(persist::KvStore& kv, const Clock& clock, uint64_t ttl_ns);

    // Granted only if no unexpired lease exists; the new epoch is previous + 1
    LeaseGrant acquire(const std::string& world, const std::string& worker);

    // Holder and epoch must match and the lease must not have lapsed
    bool renew(const std::string& world, const std::string& worker, uint64_t epoch);

    // Expires the lease, keeping its epoch. Returns false if not the holder.
    bool release(const std::string& world, const std::string& worker, uint64_t epoch);

    bool current(const std::string& world, LeaseRecord* out) const;

    // Adds "epoch is current and held" to txn; the commit throws FencedWriteError
    void fence(persist::Transaction& txn, const std::string& world, uint64_t epoch) const;

    uint64_t ttl_ns() const { return ttl_ns_; }

    static std::string lease_key(const std::string& world) { return "world/" + world + "/lease"; }

private:
    bool swap(const std::string& world, const std::string* observed, const LeaseRecord& next);

    persist::KvStore& kv_;
    const Clock& clock_;
    uint64_t ttl_ns_;
};

} // namespace loom

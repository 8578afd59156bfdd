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

#include "lease_manager.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../util/log.h"

namespace loom {

std::string LeaseRecord::encode() const {
    ByteWriter w;
    w.put_bytes(holder);
    w.put_u64(epoch);
    w.put_u64(expires_at_ns);
    return w.take();
}

LeaseRecord LeaseRecord::decode(const std::string& bytes) {
    ByteReader r(bytes, "lease");
    LeaseRecord rec;
    rec.holder = r.get_bytes();
    rec.epoch = r.get_u64();
    rec.expires_at_ns = r.get_u64();
    r.expect_done();
    return rec;
}

LeaseManager::LeaseManager(persist::KvStore& kv, const Clock& clock, uint64_t ttl_ns)
    : kv_(kv), clock_(clock), ttl_ns_(ttl_ns) {}

bool LeaseManager::current(const std::string& world, LeaseRecord* out) const {
    std::string raw;
    if (!kv_.get(lease_key(world), &raw)) return false;
    if (out) *out = LeaseRecord::decode(raw);
    return true;
}

bool LeaseManager::swap(const std::string& world, const std::string* observed, const LeaseRecord& next) {
    persist::Transaction txn;
    txn.expect_unchanged(lease_key(world), observed);
    txn.put(lease_key(world), next.encode());
    try {
        kv_.commit(txn);
    } catch (const CommitConflictError&) {
        return false;
    }
    return true;
}

LeaseGrant LeaseManager::acquire(const std::string& world, const std::string& worker) {
    LeaseGrant grant;
    std::string raw;
    bool exists = kv_.get(lease_key(world), &raw);
    LeaseRecord prev;
    if (exists) prev = LeaseRecord::decode(raw);

    const uint64_t now = clock_.now_ns();
    if (exists && prev.live(now)) {
        grant.current = prev;
        return grant;
    }

    LeaseRecord next;
    next.holder = worker;
    next.epoch = prev.epoch + 1;
    next.expires_at_ns = now + ttl_ns_;

    if (!swap(world, exists ? &raw : nullptr, next)) {
        // Lost the race; report whoever won
        current(world, &grant.current);
        return grant;
    }
    grant.granted = true;
    grant.epoch = next.epoch;
    grant.current = next;
    info() << "lease on " << world << " granted to " << worker << " at epoch " << next.epoch;
    return grant;
}

bool LeaseManager::renew(const std::string& world, const std::string& worker, uint64_t epoch) {
    std::string raw;
    if (!kv_.get(lease_key(world), &raw)) return false;
    LeaseRecord rec = LeaseRecord::decode(raw);
    const uint64_t now = clock_.now_ns();
    if (rec.holder != worker || rec.epoch != epoch || rec.expires_at_ns <= now) {
        warning() << "lease renew on " << world << " by " << worker << " epoch " << epoch
                  << " refused (holder " << rec.holder << " epoch " << rec.epoch << ")";
        return false;
    }
    rec.expires_at_ns = now + ttl_ns_;
    return swap(world, &raw, rec);
}

bool LeaseManager::release(const std::string& world, const std::string& worker, uint64_t epoch) {
    std::string raw;
    if (!kv_.get(lease_key(world), &raw)) return false;
    LeaseRecord rec = LeaseRecord::decode(raw);
    if (rec.holder != worker || rec.epoch != epoch) return false;
    rec.holder.clear();
    rec.expires_at_ns = 0;
    if (!swap(world, &raw, rec)) return false;
    info() << "lease on " << world << " released by " << worker << " at epoch " << epoch;
    return true;
}

void LeaseManager::fence(persist::Transaction& txn, const std::string& world, uint64_t epoch) const {
    txn.expect(lease_key(world),
               [epoch](const std::string* cur) {
                   if (!cur) return false;
                   LeaseRecord rec = LeaseRecord::decode(*cur);
                   return rec.epoch == epoch && !rec.holder.empty();
               },
               [world, epoch](const std::string&, const std::string* cur) {
                   uint64_t current_epoch = cur ? LeaseRecord::decode(*cur).epoch : 0;
                   throw FencedWriteError(world, epoch, current_epoch);
               });
}

} // namespace loom

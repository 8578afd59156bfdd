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

#include "delivery_queue.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../persistence/config.h"
#include "../util/log.h"

namespace loom {

const char* pipeline_scope(Pipeline p) {
    switch (p) {
        case Pipeline::Effects: return "effects";
        case Pipeline::Timers: return "timers";
        case Pipeline::Fabric: return "fabric";
    }
    return "unknown";
}

Pipeline pipeline_for(IntentKind kind) {
    switch (kind) {
        case IntentKind::Effect: return Pipeline::Effects;
        case IntentKind::Timer: return Pipeline::Timers;
        case IntentKind::Fabric: return Pipeline::Fabric;
    }
    return Pipeline::Effects;
}

std::string DispatchItem::encode() const {
    ByteWriter w;
    encode_intent(w, intent);
    w.put_u32(attempts);
    w.put_bytes(claim_owner);
    w.put_u64(claim_token);
    w.put_u64(claim_expires_at_ns);
    w.put_u64(published_at_ns);
    return w.take();
}

DispatchItem DispatchItem::decode(const std::string& bytes) {
    ByteReader r(bytes, "dispatch item");
    DispatchItem item;
    item.intent = decode_intent(r);
    item.attempts = r.get_u32();
    item.claim_owner = r.get_bytes();
    item.claim_token = r.get_u64();
    item.claim_expires_at_ns = r.get_u64();
    item.published_at_ns = r.get_u64();
    r.expect_done();
    return item;
}

DeliveryQueue::DeliveryQueue(Pipeline pipeline, persist::KvStore& kv, const LeaseManager& leases,
                             const Inbox& inbox, const Clock& clock)
    : pipeline_(pipeline), scope_(pipeline_scope(pipeline)), kv_(kv), leases_(leases), inbox_(inbox),
      clock_(clock) {}

bool DeliveryQueue::is_pending(const std::string& key) const { return kv_.get(pending_key(key), nullptr); }
bool DeliveryQueue::is_inflight(const std::string& key) const { return kv_.get(inflight_key(key), nullptr); }
bool DeliveryQueue::is_complete(const std::string& key) const { return kv_.get(dedupe_key(key), nullptr); }
size_t DeliveryQueue::pending_count() const { return kv_.scan(scope_ + "/pending/").size(); }
size_t DeliveryQueue::inflight_count() const { return kv_.scan(scope_ + "/inflight/").size(); }

bool DeliveryQueue::publish(const std::string& world, uint64_t epoch, const EffectIntent& intent) {
    if (pipeline_for(intent.kind) != pipeline_) {
        throw std::invalid_argument(std::string("intent kind ") + intent_kind_name(intent.kind) +
                                    " does not belong to " + scope_);
    }
    DispatchItem item;
    item.intent = intent;
    item.published_at_ns = clock_.now_ns();
    const std::string key = item.key();
    if (is_pending(key) || is_inflight(key) || is_complete(key)) return false;

    persist::Transaction txn;
    leases_.fence(txn, world, epoch);
    txn.expect_absent(pending_key(key));
    txn.expect_absent(inflight_key(key));
    txn.expect_absent(dedupe_key(key));
    txn.put(pending_key(key), item.encode());
    try {
        kv_.commit(txn);
    } catch (const CommitConflictError&) {
        return false;
    }
    debug() << scope_ << " published " << key.substr(0, 12) << " (" << intent.effect << ") from " << world;
    return true;
}

std::vector<Claim> DeliveryQueue::claim(const std::string& owner, size_t limit, uint64_t ttl_ns) {
    std::vector<Claim> out;
    const uint64_t now = clock_.now_ns();
    const std::string prefix = scope_ + "/pending/";
    // Timers not yet due stay behind; scan everything so a far-off timer cannot block due ones
    const size_t scan_limit = pipeline_ == Pipeline::Timers ? 0 : limit;

    for (const auto& kv : kv_.scan(prefix, scan_limit)) {
        if (limit && out.size() >= limit) break;
        DispatchItem item = DispatchItem::decode(kv.value);
        if (pipeline_ == Pipeline::Timers && item.intent.deliver_at_ns > now) continue;

        const std::string key = kv.key.substr(prefix.size());
        item.attempts += 1;
        item.claim_owner = owner;
        item.claim_token = item.attempts;
        item.claim_expires_at_ns = now + ttl_ns;

        persist::Transaction txn;
        txn.expect_value(kv.key, kv.value);
        txn.expect_absent(inflight_key(key));
        txn.erase(kv.key);
        txn.put(inflight_key(key), item.encode());
        try {
            kv_.commit(txn);
        } catch (const CommitConflictError&) {
            continue;   // another worker took it
        }

        Claim c;
        c.pipeline = pipeline_;
        c.key = key;
        c.owner = owner;
        c.token = item.claim_token;
        c.item = item;
        out.push_back(std::move(c));
    }
    return out;
}

AckResult DeliveryQueue::ack(const Claim& claim, const std::vector<InboxDelivery>& deliveries) {
    for (int attempt = 0; ; ++attempt) {
        AckResult result;
        persist::Transaction txn;

        const std::string ikey = inflight_key(claim.key);
        const std::string owner = claim.owner;
        const uint64_t token = claim.token;
        txn.expect(ikey,
                   [owner, token](const std::string* cur) {
                       if (!cur) return false;
                       DispatchItem item = DispatchItem::decode(*cur);
                       return item.claim_owner == owner && item.claim_token == token;
                   },
                   [](const std::string& key, const std::string*) { throw ClaimExpiredError(key); });

        if (is_complete(claim.key)) {
            result.status = AckStatus::AlreadyDelivered;
        } else {
            for (const auto& d : deliveries) {
                result.enqueued.push_back(inbox_.stage(txn, d.world, d.dedupe_id, d.record));
            }
            txn.expect_absent(dedupe_key(claim.key));
            txn.put(dedupe_key(claim.key), std::string());
        }
        txn.erase(ikey);

        try {
            kv_.commit(txn);
        } catch (const ClaimExpiredError&) {
            info() << scope_ << " ack for " << claim.key.substr(0, 12) << " by " << claim.owner
                   << " lost its claim (token " << claim.token << ")";
            result.status = AckStatus::ClaimLost;
            result.enqueued.clear();
            return result;
        } catch (const CommitConflictError&) {
            if (attempt + 1 >= persist::delivery::kAckRetries) throw;
            continue;
        }
        return result;
    }
}

size_t DeliveryQueue::reap() {
    const uint64_t now = clock_.now_ns();
    const std::string prefix = scope_ + "/inflight/";
    size_t requeued = 0;
    for (const auto& kv : kv_.scan(prefix)) {
        DispatchItem item = DispatchItem::decode(kv.value);
        if (item.claim_expires_at_ns > now) continue;

        const std::string key = kv.key.substr(prefix.size());
        std::string owner = item.claim_owner;
        item.claim_owner.clear();
        item.claim_expires_at_ns = 0;

        persist::Transaction txn;
        txn.expect_value(kv.key, kv.value);
        txn.erase(kv.key);
        txn.put(pending_key(key), item.encode());
        try {
            kv_.commit(txn);
        } catch (const CommitConflictError&) {
            continue;   // acked or reaped concurrently
        }
        ++requeued;
        info() << scope_ << " claim on " << key.substr(0, 12) << " by " << owner
               << " expired; requeued after " << item.attempts << " attempt(s)";
    }
    return requeued;
}

bool DeliveryQueue::release(const Claim& claim) {
    std::string raw;
    if (!kv_.get(inflight_key(claim.key), &raw)) return false;
    DispatchItem item = DispatchItem::decode(raw);
    if (item.claim_owner != claim.owner || item.claim_token != claim.token) return false;
    item.claim_owner.clear();
    item.claim_expires_at_ns = 0;

    persist::Transaction txn;
    txn.expect_value(inflight_key(claim.key), raw);
    txn.erase(inflight_key(claim.key));
    txn.put(pending_key(claim.key), item.encode());
    try {
        kv_.commit(txn);
    } catch (const CommitConflictError&) {
        return false;
    }
    return true;
}

} // namespace loom

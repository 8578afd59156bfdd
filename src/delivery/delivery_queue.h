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
#include <vector>
#include "inbox.h"
#include "../core/clock.h"
#include "../core/records.h"
#include "../lease/lease_manager.h"
#include "../persistence/kv_store.h"

namespace loom {

enum class Pipeline : uint8_t {
    Effects = 1,
    Timers = 2,
    Fabric = 3
};

const char* pipeline_scope(Pipeline p);
Pipeline pipeline_for(IntentKind kind);

/**
 * Queue entry for one intent. Keyed by the intent hash in hex under
 * <scope>/pending/, <scope>/inflight/ and <scope>/dedupe/.
 */
struct DispatchItem {
    EffectIntent intent;
    uint32_t attempts = 0;          // claims so far
    std::string claim_owner;
    uint64_t claim_token = 0;
    uint64_t claim_expires_at_ns = 0;
    uint64_t published_at_ns = 0;

    std::string key() const { return intent.intent_hash().hex(); }

    std::string encode() const;
    static DispatchItem decode(const std::string& bytes);
};

struct Claim {
    Pipeline pipeline = Pipeline::Effects;
    std::string key;
    std::string owner;
    uint64_t token = 0;
    DispatchItem item;
};

enum class AckStatus : uint8_t {
    Delivered = 1,
    AlreadyDelivered = 2,   // dedupe key was already complete
    ClaimLost = 3           // reaped or reclaimed; nothing applied
};

struct AckResult {
    AckStatus status = AckStatus::Delivered;
    std::vector<EnqueueOutcome> enqueued;   // parallel to the deliveries passed in
};

/**
 * One delivery pipeline: Pending -> Inflight(owner, expiry) -> Terminal,
 * with Inflight -> Pending on claim expiry. The three pipelines differ
 * only in scope name and in timers being claimable once due.
 */
class DeliveryQueue {
public:
    DeliveryQueue(Pipeline pipeline, persist::KvStore& kv, const LeaseManager& leases, const Inbox& inbox,
                  const Clock& clock);

    /**
     * Fenced by the publishing world's epoch. Returns false (no-op) when the
     * intent is already pending, inflight or complete.
     */
    bool publish(const std::string& world, uint64_t epoch, const EffectIntent& intent);

    std::vector<Claim> claim(const std::string& owner, size_t limit, uint64_t ttl_ns);

    /**
     * Terminal step, in one transaction: verify the claim is still current,
     * enqueue every delivery into its destination inbox (skipping ids the
     * destination has already seen), mark the dedupe key complete and drop
     * the inflight record.
     */
    AckResult ack(const Claim& claim, const std::vector<InboxDelivery>& deliveries);

    // Requeue inflight items whose claim has expired; returns how many
    size_t reap();

    // Return a claim to pending without completing it
    bool release(const Claim& claim);

    bool is_pending(const std::string& key) const;
    bool is_inflight(const std::string& key) const;
    bool is_complete(const std::string& key) const;
    size_t pending_count() const;
    size_t inflight_count() const;

    Pipeline pipeline() const { return pipeline_; }

    std::string pending_key(const std::string& key) const { return scope_ + "/pending/" + key; }
    std::string inflight_key(const std::string& key) const { return scope_ + "/inflight/" + key; }
    std::string dedupe_key(const std::string& key) const { return scope_ + "/dedupe/" + key; }

private:
    Pipeline pipeline_;
    std::string scope_;
    persist::KvStore& kv_;
    const LeaseManager& leases_;
    const Inbox& inbox_;
    const Clock& clock_;
};

} // namespace loom

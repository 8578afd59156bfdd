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

#include "world_catalog.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../util/log.h"

namespace loom {

std::string WorldMeta::encode() const {
    ByteWriter w;
    w.put_bytes(world_id);
    w.put_bytes(universe_id);
    encode_hash(w, manifest_hash);
    w.put_bytes(forked_from);
    w.put_u64(fork_height);
    w.put_u64(created_at_ns);
    return w.take();
}

WorldMeta WorldMeta::decode(const std::string& bytes) {
    ByteReader r(bytes, "world meta");
    WorldMeta m;
    m.world_id = r.get_bytes();
    m.universe_id = r.get_bytes();
    m.manifest_hash = decode_hash(r);
    m.forked_from = r.get_bytes();
    m.fork_height = r.get_u64();
    m.created_at_ns = r.get_u64();
    r.expect_done();
    return m;
}

WorldCatalog::WorldCatalog(WorldServices& services) : svc_(services) {}

bool WorldCatalog::valid_world_id(const std::string& id) {
    if (id.empty() || id.size() > 128 || id == "." || id == "..") return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

void WorldCatalog::require(const std::string& world) const {
    if (!exists(world)) throw NotFoundError("world " + world);
}

bool WorldCatalog::meta(const std::string& world, WorldMeta* out) const {
    std::string raw;
    if (!svc_.kv.get(meta_key(world), &raw)) return false;
    if (out) *out = WorldMeta::decode(raw);
    return true;
}

std::vector<std::string> WorldCatalog::list_worlds() const {
    std::vector<std::string> out;
    const std::string prefix = "worlds/";
    for (const auto& kv : svc_.kv.scan(prefix)) out.push_back(kv.key.substr(prefix.size()));
    return out;
}

WorldMeta WorldCatalog::create_world(const std::string& world_id, const std::string& universe_id,
                                     const Manifest& manifest) {
    if (!valid_world_id(world_id)) throw ConfigError("invalid world id '" + world_id + "'");

    WorldMeta m;
    m.world_id = world_id;
    m.universe_id = universe_id;
    m.manifest_hash = svc_.objects.put(manifest.encode());
    m.created_at_ns = svc_.clock.now_ns();

    persist::Transaction txn;
    txn.expect_absent(meta_key(world_id));
    txn.put(meta_key(world_id), m.encode());
    txn.put(index_key(world_id), std::string());
    // The writer journals the genesis manifest before anything else in the inbox
    svc_.inbox.stage(txn, world_id, "genesis", JournalRecord::of(ManifestChange{m.manifest_hash}));
    svc_.kv.commit(txn);

    info() << "created world " << world_id << " (universe " << universe_id << ", manifest "
           << m.manifest_hash.short_hex() << ")";
    return m;
}

WorldMeta WorldCatalog::fork_world(const std::string& source, const std::string& world_id) {
    if (!valid_world_id(world_id)) throw ConfigError("invalid world id '" + world_id + "'");
    WorldMeta src;
    if (!meta(source, &src)) throw NotFoundError("world " + source);

    WorldState state = query_state(source);
    if (!state.pending.empty()) {
        throw QuiescenceViolationError(std::vector<std::string>(), state.inflight_intents());
    }
    const uint64_t height = state.height;
    state.world_id = world_id;

    SnapshotEnvelope env;
    Hash ref = svc_.snapshots.write_envelope(state, SnapshotManager::Pins(), &env);

    SnapshotMarker marker;
    marker.snapshot_ref = ref;
    marker.height = height;
    marker.state_hash = env.state_hash;
    marker.manifest_hash = state.manifest_hash;

    BaselineRecord base;
    base.snapshot_ref = ref;
    base.height = height;
    base.manifest_hash = state.manifest_hash;

    WorldMeta m;
    m.world_id = world_id;
    m.universe_id = src.universe_id;
    m.manifest_hash = state.manifest_hash;
    m.forked_from = source;
    m.fork_height = height;
    m.created_at_ns = svc_.clock.now_ns();

    persist::Transaction txn;
    txn.expect_absent(meta_key(world_id));
    txn.put(meta_key(world_id), m.encode());
    txn.put(index_key(world_id), std::string());
    SnapshotManager::stage_baseline(txn, world_id, base);
    svc_.journal.stage_initial(txn, world_id, height, JournalRecord::of(marker));
    svc_.kv.commit(txn);

    info() << "forked " << source << " at height " << height << " into " << world_id;
    return m;
}

EnqueueOutcome WorldCatalog::submit_event(const std::string& world, const std::string& event_type,
                                          const std::string& instance_key, const std::string& payload,
                                          const std::string& correlation, const std::string& ingress_id) {
    require(world);
    IngressRecord rec;
    rec.kind = IngressKind::Event;
    rec.ingress_id = ingress_id;
    if (rec.ingress_id.empty()) {
        rec.ingress_id = "evt-" + std::to_string(svc_.clock.now_ns()) + "-" +
                         std::to_string(ingress_counter_.fetch_add(1));
    }
    rec.event_type = event_type;
    rec.instance_key = instance_key;
    rec.correlation = correlation;
    rec.payload = payload;
    return svc_.inbox.enqueue(world, rec.ingress_id, JournalRecord::of(rec));
}

EnqueueOutcome WorldCatalog::inject_receipt(const std::string& world, const Hash& intent_hash, IntentKind kind,
                                            ReceiptStatus status, const std::string& payload,
                                            const std::string& adapter_id) {
    require(world);
    ReceiptRecord rec;
    rec.intent_hash = intent_hash;
    rec.kind = kind;
    rec.status = status;
    rec.adapter_id = adapter_id;
    rec.payload = payload;
    return svc_.inbox.enqueue(world, Inbox::receipt_id(intent_hash), JournalRecord::of(rec));
}

Hash WorldCatalog::request_manifest_change(const std::string& world, const Manifest& manifest) {
    require(world);
    WorldState state = query_state(world);
    Hash h = manifest.hash();
    if (h == state.manifest_hash) return h;

    Kernel::check_quiescent(state);

    svc_.objects.put(manifest.encode());
    std::string id = "manifest:" + h.hex() + "@" + std::to_string(state.height);
    svc_.inbox.enqueue(world, id, JournalRecord::of(ManifestChange{h}));
    info() << "queued manifest change " << h.short_hex() << " for " << world;
    return h;
}

uint64_t WorldCatalog::propose_manifest(const std::string& world, const Manifest& manifest,
                                        const std::string& description) {
    require(world);
    WorldState state = query_state(world);

    GovernanceRecord rec;
    rec.action = GovernanceAction::Propose;
    rec.proposal_id = state.next_proposal_id;
    rec.manifest_hash = svc_.objects.put(manifest.encode());
    rec.description = description;

    std::string id = "proposal:" + std::to_string(rec.proposal_id);
    if (svc_.inbox.enqueue(world, id, JournalRecord::of(rec)) == EnqueueOutcome::AlreadyEnqueued) {
        throw CommitConflictError("world/" + world + " " + id);
    }
    info() << "queued proposal " << rec.proposal_id << " (" << rec.manifest_hash.short_hex() << ") for " << world;
    return rec.proposal_id;
}

ShadowSummary WorldCatalog::shadow_proposal(const std::string& world, uint64_t proposal_id,
                                            const std::vector<IngressRecord>& seeds) {
    require(world);
    WorldState state = query_state(world);
    const Proposal& p = require_proposal(state, proposal_id, GovernanceAction::Shadow);

    GovernanceRecord rec;
    rec.action = GovernanceAction::Shadow;
    rec.proposal_id = proposal_id;
    rec.shadow = ShadowRunner(svc_.kernel).run(state, p.manifest_hash, seeds);
    queue_governance(world, state.height, rec);
    return rec.shadow;
}

void WorldCatalog::approve_proposal(const std::string& world, uint64_t proposal_id, const std::string& approver) {
    require(world);
    WorldState state = query_state(world);
    require_proposal(state, proposal_id, GovernanceAction::Approve);

    GovernanceRecord rec;
    rec.action = GovernanceAction::Approve;
    rec.proposal_id = proposal_id;
    rec.approver = approver;
    queue_governance(world, state.height, rec);
}

void WorldCatalog::reject_proposal(const std::string& world, uint64_t proposal_id, const std::string& approver) {
    require(world);
    WorldState state = query_state(world);
    require_proposal(state, proposal_id, GovernanceAction::Reject);

    GovernanceRecord rec;
    rec.action = GovernanceAction::Reject;
    rec.proposal_id = proposal_id;
    rec.approver = approver;
    queue_governance(world, state.height, rec);
}

void WorldCatalog::apply_proposal(const std::string& world, uint64_t proposal_id) {
    require(world);
    WorldState state = query_state(world);
    const Proposal& p = require_proposal(state, proposal_id, GovernanceAction::Apply);
    if (p.manifest_hash != state.manifest_hash) Kernel::check_quiescent(state);

    GovernanceRecord rec;
    rec.action = GovernanceAction::Apply;
    rec.proposal_id = proposal_id;
    queue_governance(world, state.height, rec);
}

const Proposal& WorldCatalog::require_proposal(const WorldState& state, uint64_t proposal_id,
                                               GovernanceAction action) const {
    const Proposal* p = state.find_proposal(proposal_id);
    if (!p) throw NotFoundError("world " + state.world_id + " has no proposal " + std::to_string(proposal_id));
    if (const char* needs = proposal_requirement(*p, action)) {
        throw ProposalStateError(proposal_id, proposal_state_name(p->state), needs);
    }
    return *p;
}

void WorldCatalog::queue_governance(const std::string& world, uint64_t height, const GovernanceRecord& rec) {
    std::string id = "proposal:" + std::to_string(rec.proposal_id) + ":" + governance_action_name(rec.action) +
                     "@" + std::to_string(height);
    if (svc_.inbox.enqueue(world, id, JournalRecord::of(rec)) == EnqueueOutcome::AlreadyEnqueued) {
        debug() << "world " << world << " already has " << id << " queued";
        return;
    }
    info() << "queued " << governance_action_name(rec.action) << " of proposal " << rec.proposal_id << " for "
           << world;
}

WorldState WorldCatalog::query_state(const std::string& world) const {
    require(world);
    return svc_.replayer.restore(world);
}

} // namespace loom

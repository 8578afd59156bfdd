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

#include "snapshot_manager.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../util/log.h"
#include <map>

namespace loom {

const SnapshotRoot* SnapshotEnvelope::find_root(const std::string& name) const {
    for (const auto& r : roots) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

std::string SnapshotEnvelope::encode() const {
    ByteWriter w;
    w.put_u64(height);
    encode_hash(w, manifest_hash);
    encode_hash(w, state_hash);
    w.put_u32(static_cast<uint32_t>(roots.size()));
    for (const auto& r : roots) {
        w.put_bytes(r.name);
        encode_hash(w, r.hash);
    }
    w.put_u64(created_at_ns);
    return w.take();
}

SnapshotEnvelope SnapshotEnvelope::decode(const std::string& bytes) {
    ByteReader r(bytes, "snapshot envelope");
    SnapshotEnvelope e;
    e.height = r.get_u64();
    e.manifest_hash = decode_hash(r);
    e.state_hash = decode_hash(r);
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        SnapshotRoot root;
        root.name = r.get_bytes();
        root.hash = decode_hash(r);
        e.roots.push_back(root);
    }
    e.created_at_ns = r.get_u64();
    r.expect_done();
    return e;
}

std::string BaselineRecord::encode() const {
    ByteWriter w;
    encode_hash(w, snapshot_ref);
    w.put_u64(height);
    encode_hash(w, manifest_hash);
    return w.take();
}

BaselineRecord BaselineRecord::decode(const std::string& bytes) {
    ByteReader r(bytes, "baseline");
    BaselineRecord b;
    b.snapshot_ref = decode_hash(r);
    b.height = r.get_u64();
    b.manifest_hash = decode_hash(r);
    r.expect_done();
    return b;
}

SnapshotManager::SnapshotManager(persist::KvStore& kv, persist::ObjectStore& objects, Journal& journal,
                                 const LeaseManager& leases, const Clock& clock)
    : kv_(kv), objects_(objects), journal_(journal), leases_(leases), clock_(clock) {}

namespace {

void check_complete(const persist::ObjectStore& objects, const SnapshotEnvelope& env) {
    std::vector<std::string> missing;
    for (const auto& r : env.roots) {
        if (!objects.contains(r.hash)) missing.push_back(r.name + " (" + r.hash.short_hex() + ")");
    }
    if (!env.manifest_hash.is_zero() && !env.find_root("manifest")) {
        missing.push_back("manifest (undeclared)");
    }
    if (!env.find_root("kernel")) missing.push_back("kernel (undeclared)");
    if (!missing.empty()) throw RootIncompleteError(missing);
}

} // namespace

Hash SnapshotManager::write_envelope(const WorldState& state, const Pins& pins, SnapshotEnvelope* out) {
    SnapshotEnvelope env;
    env.height = state.height;
    env.manifest_hash = state.manifest_hash;
    env.state_hash = state.state_hash();
    env.created_at_ns = clock_.now_ns();

    if (!state.manifest_hash.is_zero()) {
        env.roots.push_back(SnapshotRoot{"manifest", state.manifest_hash});
    }
    env.roots.push_back(SnapshotRoot{"kernel", objects_.put(state.encode_meta())});

    // Per-workflow index: (key, instance root) pairs in key order
    std::map<std::string, ByteWriter> indexes;
    std::map<std::string, uint32_t> counts;
    std::vector<SnapshotRoot> instance_roots;
    for (const auto& kv : state.instances) {
        const WorkflowInstance& inst = kv.second;
        Hash h = objects_.put(inst.encode());
        instance_roots.push_back(SnapshotRoot{"instance/" + inst.id(), h});
        ByteWriter& idx = indexes[inst.workflow];
        idx.put_bytes(inst.key);
        encode_hash(idx, h);
        ++counts[inst.workflow];
    }
    for (auto& kv : indexes) {
        ByteWriter blob;
        blob.put_u32(counts[kv.first]);
        blob.put_raw(kv.second.str().data(), kv.second.size());
        env.roots.push_back(SnapshotRoot{"workflow/" + kv.first, objects_.put(blob.str())});
    }
    env.roots.insert(env.roots.end(), instance_roots.begin(), instance_roots.end());
    for (const auto& pin : pins) {
        env.roots.push_back(SnapshotRoot{"pin/" + pin.first, pin.second});
    }

    check_complete(objects_, env);
    Hash ref = objects_.put(env.encode());
    if (out) *out = env;
    return ref;
}

SnapshotResult SnapshotManager::create_snapshot(const WorldState& state, uint64_t epoch, const Pins& pins) {
    uint64_t head = journal_.head(state.world_id);
    if (head != state.height) {
        throw StaleHeightError(state.world_id, state.height, head);
    }

    SnapshotResult result;
    result.snapshot_ref = write_envelope(state, pins, &result.envelope);

    SnapshotMarker marker;
    marker.snapshot_ref = result.snapshot_ref;
    marker.height = state.height;
    marker.state_hash = result.envelope.state_hash;
    marker.manifest_hash = state.manifest_hash;
    result.marker = JournalRecord::of(marker);
    result.marker_height = journal_.append(state.world_id, epoch, state.height, result.marker);

    info() << "snapshot " << result.snapshot_ref.short_hex() << " of " << state.world_id << " at height "
           << state.height << " (" << result.envelope.roots.size() << " roots)";
    return result;
}

bool SnapshotManager::promote_baseline(const std::string& world, uint64_t epoch, const Hash& snapshot_ref,
                                       const WorldState& current_state) {
    SnapshotEnvelope env = load_envelope(snapshot_ref);

    std::vector<std::string> open = current_state.open_intents_below(env.height);
    if (!open.empty()) {
        throw ReceiptHorizonViolationError(env.height, open);
    }

    std::string observed;
    bool exists = kv_.get(baseline_key(world), &observed);
    if (exists && BaselineRecord::decode(observed).height >= env.height) {
        return false;
    }

    BaselineRecord next;
    next.snapshot_ref = snapshot_ref;
    next.height = env.height;
    next.manifest_hash = env.manifest_hash;

    persist::Transaction txn;
    leases_.fence(txn, world, epoch);
    txn.expect_unchanged(baseline_key(world), exists ? &observed : nullptr);
    txn.put(baseline_key(world), next.encode());
    kv_.commit(txn);

    info() << "baseline of " << world << " promoted to " << snapshot_ref.short_hex() << " at height " << env.height;
    return true;
}

SnapshotEnvelope SnapshotManager::load_envelope(const Hash& snapshot_ref) const {
    SnapshotEnvelope env = SnapshotEnvelope::decode(objects_.get(snapshot_ref));
    check_complete(objects_, env);
    return env;
}

WorldState SnapshotManager::load_state(const SnapshotEnvelope& envelope) const {
    const SnapshotRoot* kernel = envelope.find_root("kernel");
    if (!kernel) throw RootIncompleteError({"kernel (undeclared)"});

    WorldState state;
    state.decode_meta(objects_.get(kernel->hash));

    for (const auto& root : envelope.roots) {
        if (root.name.compare(0, 9, "workflow/") != 0) continue;
        ByteReader r(objects_.get(root.hash), "workflow index");
        uint32_t n = r.get_u32();
        for (uint32_t i = 0; i < n; ++i) {
            r.get_bytes();
            WorkflowInstance inst = WorkflowInstance::decode(objects_.get(decode_hash(r)));
            std::string id = inst.id();
            if (!state.instances.emplace(id, std::move(inst)).second) {
                throw CorruptError("snapshot lists instance " + id + " twice");
            }
        }
        r.expect_done();
    }

    Hash rebuilt = state.state_hash();
    if (rebuilt != envelope.state_hash || state.height != envelope.height) {
        throw ReplayMismatchError(state.world_id, envelope.height,
                                  "snapshot rebuilds to " + rebuilt.short_hex() + ", envelope says " +
                                  envelope.state_hash.short_hex());
    }
    return state;
}

bool SnapshotManager::baseline(const std::string& world, BaselineRecord* out) const {
    std::string raw;
    if (!kv_.get(baseline_key(world), &raw)) return false;
    if (out) *out = BaselineRecord::decode(raw);
    return true;
}

void SnapshotManager::stage_baseline(persist::Transaction& txn, const std::string& world,
                                     const BaselineRecord& b) {
    txn.expect_absent(baseline_key(world));
    txn.put(baseline_key(world), b.encode());
}

} // namespace loom

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
#include <utility>
#include <vector>
#include "../core/clock.h"
#include "../core/hash.h"
#include "../journal/journal.h"
#include "../kernel/world_state.h"
#include "../lease/lease_manager.h"
#include "../persistence/kv_store.h"
#include "../persistence/object_store.h"

namespace loom {

struct SnapshotRoot {
    std::string name;   // manifest, kernel, workflow/<name>, instance/<id>, pin/<name>
    Hash hash;
};

/**
 * Self-describing snapshot. The envelope itself is a blob in the object
 * store; its hash is the snapshot_ref. It is only valid while every root
 * resolves.
 */
struct SnapshotEnvelope {
    uint64_t height = 0;
    Hash manifest_hash;
    Hash state_hash;
    std::vector<SnapshotRoot> roots;
    uint64_t created_at_ns = 0;

    const SnapshotRoot* find_root(const std::string& name) const;

    std::string encode() const;
    static SnapshotEnvelope decode(const std::string& bytes);
};

struct BaselineRecord {
    Hash snapshot_ref;
    uint64_t height = 0;
    Hash manifest_hash;

    std::string encode() const;
    static BaselineRecord decode(const std::string& bytes);
};

struct SnapshotResult {
    Hash snapshot_ref;
    SnapshotEnvelope envelope;
    JournalRecord marker;
    uint64_t marker_height = 0;
};

class SnapshotManager {
public:
    using Pins = std::vector<std::pair<std::string, Hash>>;

    SnapshotManager(persist::KvStore& kv, persist::ObjectStore& objects, Journal& journal,
                    const LeaseManager& leases, const Clock& clock);

    /**
     * Capture state, which must be folded up to the journal head. Writes
     * every root, checks completeness (RootIncompleteError), stores the
     * envelope and appends a SnapshotMarker at state.height. The caller
     * folds the returned marker.
     */
    SnapshotResult create_snapshot(const WorldState& state, uint64_t epoch, const Pins& pins = Pins());

    /**
     * Make ref the restore floor. Throws ReceiptHorizonViolationError if any
     * intent emitted below the snapshot height is still open in
     * current_state. Returns false when the baseline is already at or above
     * the snapshot height.
     */
    bool promote_baseline(const std::string& world, uint64_t epoch, const Hash& snapshot_ref,
                          const WorldState& current_state);

    // Completeness checked; throws RootIncompleteError or NotFoundError
    SnapshotEnvelope load_envelope(const Hash& snapshot_ref) const;

    // Rebuild and verify the captured state
    WorldState load_state(const SnapshotEnvelope& envelope) const;

    bool baseline(const std::string& world, BaselineRecord* out) const;

    // Written by the catalog when a world starts from a snapshot
    static void stage_baseline(persist::Transaction& txn, const std::string& world, const BaselineRecord& b);

    static std::string baseline_key(const std::string& world) { return "world/" + world + "/baseline"; }

    Hash write_envelope(const WorldState& state, const Pins& pins, SnapshotEnvelope* out);

private:
    persist::KvStore& kv_;
    persist::ObjectStore& objects_;
    Journal& journal_;
    const LeaseManager& leases_;
    const Clock& clock_;
};

} // namespace loom

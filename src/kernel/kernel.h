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

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "manifest.h"
#include "module_host.h"
#include "policy.h"
#include "world_state.h"
#include "../core/records.h"
#include "../persistence/object_store.h"

namespace loom {

struct ApplyResult {
    std::vector<EffectIntent> emitted;
    std::vector<Rejection> rejections;
};

/**
 * The world engine: a pure fold of journal records into WorldState.
 *
 * apply() reads only the record, the state, immutable manifest blobs and
 * the module host. Logical time comes from the records themselves. Nothing
 * here touches the key/value store; the worker owns all writes.
 */
class Kernel {
public:
    Kernel(const persist::ObjectStore& objects, ModuleHost& host);

    WorldState genesis(const std::string& world_id) const;

    /**
     * Fold one record at the given height. Throws JournalGapError when the
     * height is not state.height, ReplayMismatchError when a journaled
     * EffectIntent or SnapshotMarker disagrees with the fold.
     */
    ApplyResult apply(WorldState& state, uint64_t height, const JournalRecord& record);

    // Throws QuiescenceViolationError naming every blocker
    static void check_quiescent(const WorldState& state);

    std::shared_ptr<const Manifest> manifest(const Hash& hash) const;
    std::shared_ptr<const PolicyGate> policy(const Hash& manifest_hash) const;

private:
    void apply_ingress(WorldState& state, uint64_t height, const IngressRecord& rec, ApplyResult& out);
    void apply_receipt(WorldState& state, uint64_t height, const ReceiptRecord& rec, ApplyResult& out);
    void apply_intent(WorldState& state, uint64_t height, const EffectIntent& rec);
    void apply_snapshot_marker(const WorldState& state, uint64_t height, const SnapshotMarker& rec);
    void apply_manifest_change(WorldState& state, uint64_t height, const ManifestChange& rec, ApplyResult& out);
    void apply_governance(WorldState& state, uint64_t height, const GovernanceRecord& rec, ApplyResult& out);

    // Quiescence-gated; records a rejection and returns false when blocked
    bool swap_manifest(WorldState& state, uint64_t height, const Hash& target, const std::string& subject,
                       ApplyResult& out);

    void invoke(WorldState& state, uint64_t height, WorkflowInstance& inst, const WorkflowDef& def,
                const WorkflowEvent& event, ApplyResult& out);
    // False when the manifest's policy denied the intent
    bool emit(WorldState& state, uint64_t height, WorkflowInstance& inst, const EffectRequest& req,
              const std::string& next_await, ApplyResult& out);
    void reject(WorldState& state, ApplyResult& out, const Rejection& r);

    const persist::ObjectStore& objects_;
    ModuleHost& host_;

    mutable std::mutex cache_mutex_;
    mutable std::map<Hash, std::shared_ptr<const Manifest>> manifests_;
    mutable std::map<Hash, std::shared_ptr<const PolicyGate>> gates_;
};

} // namespace loom

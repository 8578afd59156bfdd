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

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "world_services.h"
#include "../kernel/manifest.h"
#include "../kernel/shadow_runner.h"

namespace loom {

struct WorldMeta {
    std::string world_id;
    std::string universe_id;
    Hash manifest_hash;          // manifest at creation
    std::string forked_from;
    uint64_t fork_height = 0;
    uint64_t created_at_ns = 0;

    std::string encode() const;
    static WorldMeta decode(const std::string& bytes);
};

/**
 * Control surface. Creates and forks worlds and produces their ingress;
 * it never journals anything itself. Read queries fold committed history
 * and never take the lease.
 */
class WorldCatalog {
public:
    explicit WorldCatalog(WorldServices& services);

    // Throws ConfigError for a bad id, CommitConflictError if it exists
    WorldMeta create_world(const std::string& world_id, const std::string& universe_id, const Manifest& manifest);

    /**
     * New world starting from the source's committed state, rebased onto
     * the new id and captured as the fork's baseline. The source must have
     * no intents in flight (QuiescenceViolationError otherwise). Inbox and
     * dedupe tables start empty.
     */
    WorldMeta fork_world(const std::string& source, const std::string& world_id);

    // Empty ingress_id gets a generated one
    EnqueueOutcome submit_event(const std::string& world, const std::string& event_type,
                                const std::string& instance_key, const std::string& payload,
                                const std::string& correlation = std::string(),
                                const std::string& ingress_id = std::string());

    EnqueueOutcome inject_receipt(const std::string& world, const Hash& intent_hash, IntentKind kind,
                                  ReceiptStatus status, const std::string& payload,
                                  const std::string& adapter_id = "operator");

    /**
     * Stores the manifest and queues the change for the world's writer.
     * Checks the quiescence gate eagerly against committed state and throws
     * QuiescenceViolationError naming the blockers.
     */
    Hash request_manifest_change(const std::string& world, const Manifest& manifest);

    /**
     * Manifest governance: propose, shadow, approve or reject, apply. Each
     * step is checked against committed state first (NotFoundError,
     * ProposalStateError) and then queued as a Governance record; the fold
     * checks again and records a rejection if the world moved on meanwhile.
     * propose_manifest returns the new id and throws CommitConflictError
     * while an earlier proposal is still waiting in the inbox.
     */
    uint64_t propose_manifest(const std::string& world, const Manifest& manifest, const std::string& description);
    ShadowSummary shadow_proposal(const std::string& world, uint64_t proposal_id,
                                  const std::vector<IngressRecord>& seeds = std::vector<IngressRecord>());
    void approve_proposal(const std::string& world, uint64_t proposal_id, const std::string& approver);
    void reject_proposal(const std::string& world, uint64_t proposal_id, const std::string& approver);
    // Also checks the quiescence gate eagerly
    void apply_proposal(const std::string& world, uint64_t proposal_id);

    std::vector<std::string> list_worlds() const;
    bool meta(const std::string& world, WorldMeta* out) const;
    bool exists(const std::string& world) const { return meta(world, nullptr); }

    // Committed state of a world, folded from its restore floor
    WorldState query_state(const std::string& world) const;

    static bool valid_world_id(const std::string& id);
    static std::string meta_key(const std::string& world) { return "world/" + world + "/meta"; }
    static std::string index_key(const std::string& world) { return "worlds/" + world; }

private:
    void require(const std::string& world) const;
    const Proposal& require_proposal(const WorldState& state, uint64_t proposal_id, GovernanceAction action) const;
    void queue_governance(const std::string& world, uint64_t height, const GovernanceRecord& rec);

    WorldServices& svc_;
    std::atomic<uint64_t> ingress_counter_{0};
};

} // namespace loom

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
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "../core/error.h"
#include "../core/hash.h"
#include "../core/records.h"

namespace loom {

enum class InstanceStatus : uint8_t {
    Created = 1,
    Active = 2,
    AwaitingReceipt = 3,
    Terminal = 4
};

const char* instance_status_name(InstanceStatus status);

enum class ProposalState : uint8_t {
    Submitted = 1,
    Shadowed = 2,
    Approved = 3,
    Rejected = 4,
    Applied = 5
};

const char* proposal_state_name(ProposalState state);

/**
 * Persisted state machine for one (workflow, key). Suspension is just
 * status AwaitingReceipt plus await_key; there is no execution context to
 * keep. Instances are never deleted.
 */
struct WorkflowInstance {
    std::string workflow;
    std::string key;
    InstanceStatus status = InstanceStatus::Created;
    std::string await_key;
    std::string state;          // opaque module bytes
    uint64_t emissions = 0;     // default idempotency key source
    std::set<Hash> inflight;
    std::string last_error;
    uint64_t created_at = 0;    // heights
    uint64_t updated_at = 0;

    // Workflow names never contain '/', so the first '/' splits the id
    static std::string make_id(const std::string& workflow, const std::string& key) { return workflow + "/" + key; }
    std::string id() const { return make_id(workflow, key); }
    bool terminal() const { return status == InstanceStatus::Terminal; }

    std::string encode() const;
    static WorkflowInstance decode(const std::string& bytes);
};

struct PendingIntent {
    EffectIntent intent;
    std::string instance_id;
    bool journaled = false;   // an EffectIntent record has been folded
};

/**
 * A candidate manifest moving through propose, shadow, approve (or
 * reject) and apply. Re-shadowing an approved proposal drops the
 * approval. Rejected and Applied are settled.
 */
struct Proposal {
    uint64_t id = 0;
    Hash manifest_hash;
    std::string description;
    ProposalState state = ProposalState::Submitted;
    ShadowSummary shadow;
    std::string approver;
    uint64_t proposed_at = 0;   // heights
    uint64_t applied_at = 0;

    bool settled() const { return state == ProposalState::Rejected || state == ProposalState::Applied; }
};

// nullptr when the action may follow; otherwise the state it needs
const char* proposal_requirement(const Proposal& p, GovernanceAction action);

// Deterministic record of a rejected action inside the fold
struct Rejection {
    uint64_t height = 0;
    ErrorKind kind = ErrorKind::NotFound;
    std::string subject;
    std::string detail;
};

/**
 * Everything the kernel fold produces. height is the number of records
 * folded so far, which is also the height of the next record to apply.
 * All containers are ordered so the encoding (and state_hash) is canonical.
 */
struct WorldState {
    static constexpr size_t kMaxRejections = 64;

    std::string world_id;
    uint64_t height = 0;
    Hash manifest_hash;
    uint64_t logical_now_ns = 0;
    std::map<std::string, WorkflowInstance> instances;  // by id()
    std::map<Hash, PendingIntent> pending;
    // Every intent whose receipt was folded. Never pruned: it is what keeps
    // a re-emitted intent a DuplicateIntent no-op for the life of the world,
    // so snapshots carry it and state_hash covers it.
    std::set<Hash> completed;
    std::deque<Rejection> rejections;  // most recent kMaxRejections
    uint64_t rejection_count = 0;
    std::map<uint64_t, Proposal> proposals;
    uint64_t next_proposal_id = 0;

    void record_rejection(const Rejection& r);

    Proposal* find_proposal(uint64_t id);
    const Proposal* find_proposal(uint64_t id) const;

    WorkflowInstance* find_instance(const std::string& id);
    const WorkflowInstance* find_instance(const std::string& id) const;

    std::vector<std::string> non_terminal_instances() const;
    std::vector<std::string> inflight_intents() const;       // hex
    std::vector<std::string> open_intents_below(uint64_t height) const;
    std::vector<const PendingIntent*> unjournaled() const;

    // Kernel metadata (everything except instances)
    std::string encode_meta() const;
    void decode_meta(const std::string& bytes);

    std::string encode() const;
    static WorldState decode(const std::string& bytes);
    Hash state_hash() const { return sha256(encode()); }
};

} // namespace loom

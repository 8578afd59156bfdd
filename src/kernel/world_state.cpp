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

#include "world_state.h"
#include "../core/wire.h"

namespace loom {

const char* instance_status_name(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::Created: return "Created";
        case InstanceStatus::Active: return "Active";
        case InstanceStatus::AwaitingReceipt: return "AwaitingReceipt";
        case InstanceStatus::Terminal: return "Terminal";
    }
    return "Unknown";
}

const char* proposal_state_name(ProposalState state) {
    switch (state) {
        case ProposalState::Submitted: return "Submitted";
        case ProposalState::Shadowed: return "Shadowed";
        case ProposalState::Approved: return "Approved";
        case ProposalState::Rejected: return "Rejected";
        case ProposalState::Applied: return "Applied";
    }
    return "Unknown";
}

const char* proposal_requirement(const Proposal& p, GovernanceAction action) {
    switch (action) {
        case GovernanceAction::Propose:
            return "an unused id";
        case GovernanceAction::Shadow:
            return p.settled() ? "Submitted, Shadowed or Approved" : nullptr;
        case GovernanceAction::Approve:
        case GovernanceAction::Reject:
            return p.state == ProposalState::Shadowed || p.state == ProposalState::Approved
                       ? nullptr : "Shadowed";
        case GovernanceAction::Apply:
            return p.state == ProposalState::Approved ? nullptr : "Approved";
    }
    return "a known action";
}

namespace {

void put_strings(ByteWriter& w, const std::vector<std::string>& items) {
    w.put_u32(static_cast<uint32_t>(items.size()));
    for (const auto& s : items) w.put_bytes(s);
}

std::vector<std::string> get_strings(ByteReader& r) {
    std::vector<std::string> out;
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) out.push_back(r.get_bytes());
    return out;
}

void encode_proposal(ByteWriter& w, const Proposal& p) {
    w.put_u64(p.id);
    encode_hash(w, p.manifest_hash);
    w.put_bytes(p.description);
    w.put_u8(static_cast<uint8_t>(p.state));
    put_strings(w, p.shadow.predicted_effects);
    put_strings(w, p.shadow.rejections);
    put_strings(w, p.shadow.workflow_deltas);
    put_strings(w, p.shadow.blockers);
    w.put_bytes(p.approver);
    w.put_u64(p.proposed_at);
    w.put_u64(p.applied_at);
}

Proposal decode_proposal(ByteReader& r) {
    Proposal p;
    p.id = r.get_u64();
    p.manifest_hash = decode_hash(r);
    p.description = r.get_bytes();
    uint8_t state = r.get_u8();
    if (state < 1 || state > 5) throw CorruptError("bad proposal state " + std::to_string(state));
    p.state = static_cast<ProposalState>(state);
    p.shadow.predicted_effects = get_strings(r);
    p.shadow.rejections = get_strings(r);
    p.shadow.workflow_deltas = get_strings(r);
    p.shadow.blockers = get_strings(r);
    p.approver = r.get_bytes();
    p.proposed_at = r.get_u64();
    p.applied_at = r.get_u64();
    return p;
}

} // namespace

std::string WorkflowInstance::encode() const {
    ByteWriter w;
    w.put_bytes(workflow);
    w.put_bytes(key);
    w.put_u8(static_cast<uint8_t>(status));
    w.put_bytes(await_key);
    w.put_bytes(state);
    w.put_u64(emissions);
    w.put_u32(static_cast<uint32_t>(inflight.size()));
    for (const auto& h : inflight) encode_hash(w, h);
    w.put_bytes(last_error);
    w.put_u64(created_at);
    w.put_u64(updated_at);
    return w.take();
}

WorkflowInstance WorkflowInstance::decode(const std::string& bytes) {
    ByteReader r(bytes, "workflow instance");
    WorkflowInstance inst;
    inst.workflow = r.get_bytes();
    inst.key = r.get_bytes();
    uint8_t status = r.get_u8();
    if (status < 1 || status > 4) throw CorruptError("bad instance status " + std::to_string(status));
    inst.status = static_cast<InstanceStatus>(status);
    inst.await_key = r.get_bytes();
    inst.state = r.get_bytes();
    inst.emissions = r.get_u64();
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) inst.inflight.insert(decode_hash(r));
    inst.last_error = r.get_bytes();
    inst.created_at = r.get_u64();
    inst.updated_at = r.get_u64();
    r.expect_done();
    return inst;
}

void WorldState::record_rejection(const Rejection& r) {
    rejections.push_back(r);
    while (rejections.size() > kMaxRejections) rejections.pop_front();
    ++rejection_count;
}

Proposal* WorldState::find_proposal(uint64_t id) {
    auto it = proposals.find(id);
    return it == proposals.end() ? nullptr : &it->second;
}

const Proposal* WorldState::find_proposal(uint64_t id) const {
    auto it = proposals.find(id);
    return it == proposals.end() ? nullptr : &it->second;
}

WorkflowInstance* WorldState::find_instance(const std::string& id) {
    auto it = instances.find(id);
    return it == instances.end() ? nullptr : &it->second;
}

const WorkflowInstance* WorldState::find_instance(const std::string& id) const {
    auto it = instances.find(id);
    return it == instances.end() ? nullptr : &it->second;
}

std::vector<std::string> WorldState::non_terminal_instances() const {
    std::vector<std::string> out;
    for (const auto& kv : instances) {
        if (!kv.second.terminal()) out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> WorldState::inflight_intents() const {
    std::vector<std::string> out;
    for (const auto& kv : pending) out.push_back(kv.first.hex());
    return out;
}

std::vector<std::string> WorldState::open_intents_below(uint64_t h) const {
    std::vector<std::string> out;
    for (const auto& kv : pending) {
        if (kv.second.intent.emitted_at < h) out.push_back(kv.first.hex());
    }
    return out;
}

std::vector<const PendingIntent*> WorldState::unjournaled() const {
    std::vector<const PendingIntent*> out;
    for (const auto& kv : pending) {
        if (!kv.second.journaled) out.push_back(&kv.second);
    }
    return out;
}

std::string WorldState::encode_meta() const {
    ByteWriter w;
    w.put_bytes(world_id);
    w.put_u64(height);
    encode_hash(w, manifest_hash);
    w.put_u64(logical_now_ns);

    w.put_u32(static_cast<uint32_t>(pending.size()));
    for (const auto& kv : pending) {
        encode_intent(w, kv.second.intent);
        w.put_bytes(kv.second.instance_id);
        w.put_bool(kv.second.journaled);
    }

    w.put_u32(static_cast<uint32_t>(completed.size()));
    for (const auto& h : completed) encode_hash(w, h);

    w.put_u32(static_cast<uint32_t>(rejections.size()));
    for (const auto& rej : rejections) {
        w.put_u64(rej.height);
        w.put_u8(static_cast<uint8_t>(rej.kind));
        w.put_bytes(rej.subject);
        w.put_bytes(rej.detail);
    }
    w.put_u64(rejection_count);

    w.put_u32(static_cast<uint32_t>(proposals.size()));
    for (const auto& kv : proposals) encode_proposal(w, kv.second);
    w.put_u64(next_proposal_id);
    return w.take();
}

void WorldState::decode_meta(const std::string& bytes) {
    ByteReader r(bytes, "kernel meta");
    world_id = r.get_bytes();
    height = r.get_u64();
    manifest_hash = decode_hash(r);
    logical_now_ns = r.get_u64();

    pending.clear();
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        PendingIntent p;
        p.intent = decode_intent(r);
        p.instance_id = r.get_bytes();
        p.journaled = r.get_bool();
        pending[p.intent.intent_hash()] = p;
    }

    completed.clear();
    n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) completed.insert(decode_hash(r));

    rejections.clear();
    n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        Rejection rej;
        rej.height = r.get_u64();
        rej.kind = static_cast<ErrorKind>(r.get_u8());
        rej.subject = r.get_bytes();
        rej.detail = r.get_bytes();
        rejections.push_back(rej);
    }
    rejection_count = r.get_u64();

    proposals.clear();
    n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        Proposal p = decode_proposal(r);
        uint64_t id = p.id;
        if (!proposals.emplace(id, std::move(p)).second) {
            throw CorruptError("proposal " + std::to_string(id) + " appears twice");
        }
    }
    next_proposal_id = r.get_u64();
    r.expect_done();
}

std::string WorldState::encode() const {
    ByteWriter w;
    w.put_bytes(encode_meta());
    w.put_u32(static_cast<uint32_t>(instances.size()));
    for (const auto& kv : instances) w.put_bytes(kv.second.encode());
    return w.take();
}

WorldState WorldState::decode(const std::string& bytes) {
    ByteReader r(bytes, "world state");
    WorldState s;
    s.decode_meta(r.get_bytes());
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        WorkflowInstance inst = WorkflowInstance::decode(r.get_bytes());
        std::string id = inst.id();
        s.instances.emplace(std::move(id), std::move(inst));
    }
    r.expect_done();
    return s;
}

} // namespace loom

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

#include "kernel.h"
#include "dispatch_guard.h"
#include "../util/log.h"

namespace loom {

Kernel::Kernel(const persist::ObjectStore& objects, ModuleHost& host)
    : objects_(objects), host_(host) {}

WorldState Kernel::genesis(const std::string& world_id) const {
    WorldState s;
    s.world_id = world_id;
    return s;
}

std::shared_ptr<const Manifest> Kernel::manifest(const Hash& hash) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = manifests_.find(hash);
    if (it != manifests_.end()) return it->second;
    auto m = std::make_shared<const Manifest>(Manifest::decode(objects_.get(hash)));
    manifests_[hash] = m;
    return m;
}

std::shared_ptr<const PolicyGate> Kernel::policy(const Hash& manifest_hash) const {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = gates_.find(manifest_hash);
        if (it != gates_.end()) return it->second;
    }
    std::shared_ptr<const PolicyGate> gate = manifest(manifest_hash)->make_gate();
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return gates_.emplace(manifest_hash, gate).first->second;
}

void Kernel::check_quiescent(const WorldState& state) {
    std::vector<std::string> instances = state.non_terminal_instances();
    std::vector<std::string> intents = state.inflight_intents();
    if (!instances.empty() || !intents.empty()) {
        throw QuiescenceViolationError(instances, intents);
    }
}

ApplyResult Kernel::apply(WorldState& state, uint64_t height, const JournalRecord& record) {
    if (height != state.height) {
        throw JournalGapError(state.world_id, state.height,
                              "fold was handed height " + std::to_string(height));
    }
    ApplyResult out;
    switch (record.kind) {
        case RecordKind::Ingress:
            apply_ingress(state, height, record.ingress, out);
            break;
        case RecordKind::Receipt:
            apply_receipt(state, height, record.receipt, out);
            break;
        case RecordKind::EffectIntent:
            apply_intent(state, height, record.intent);
            break;
        case RecordKind::SnapshotMarker:
            apply_snapshot_marker(state, height, record.snapshot);
            break;
        case RecordKind::ManifestChange:
            apply_manifest_change(state, height, record.manifest, out);
            break;
        case RecordKind::Governance:
            apply_governance(state, height, record.governance, out);
            break;
    }
    state.height = height + 1;
    return out;
}

void Kernel::reject(WorldState& state, ApplyResult& out, const Rejection& r) {
    debug() << "world " << state.world_id << " @" << r.height << " rejected "
            << error_kind_name(r.kind) << " " << r.subject << ": " << r.detail;
    state.record_rejection(r);
    out.rejections.push_back(r);
}

void Kernel::apply_ingress(WorldState& state, uint64_t height, const IngressRecord& rec, ApplyResult& out) {
    if (rec.logical_now_ns > state.logical_now_ns) state.logical_now_ns = rec.logical_now_ns;

    if (state.manifest_hash.is_zero()) {
        reject(state, out, Rejection{height, ErrorKind::NotFound, rec.event_type, "world has no manifest"});
        return;
    }
    std::shared_ptr<const Manifest> m = manifest(state.manifest_hash);
    const WorkflowDef* def = rec.kind == IngressKind::Fabric ? m->find(rec.dest_workflow)
                                                             : m->route(rec.event_type);
    if (!def) {
        const std::string& subject = rec.kind == IngressKind::Fabric ? rec.dest_workflow : rec.event_type;
        reject(state, out, Rejection{height, ErrorKind::NotFound, subject, "no workflow for ingress"});
        return;
    }

    std::string id = WorkflowInstance::make_id(def->name, rec.instance_key);
    WorkflowInstance* inst = state.find_instance(id);
    if (!inst) {
        WorkflowInstance fresh;
        fresh.workflow = def->name;
        fresh.key = rec.instance_key;
        fresh.created_at = height;
        fresh.updated_at = height;
        inst = &state.instances.emplace(id, std::move(fresh)).first->second;
    }
    if (inst->terminal()) return;
    if (inst->status == InstanceStatus::AwaitingReceipt && rec.correlation != inst->await_key) return;

    WorkflowEvent ev;
    ev.source = rec.kind == IngressKind::Fabric ? EventSource::Fabric : EventSource::Event;
    ev.type = rec.event_type;
    ev.payload = rec.payload;
    ev.correlation = rec.correlation;
    ev.source_world = rec.source_world;
    ev.logical_now_ns = state.logical_now_ns;
    invoke(state, height, *inst, *def, ev, out);
}

void Kernel::apply_receipt(WorldState& state, uint64_t height, const ReceiptRecord& rec, ApplyResult& out) {
    if (rec.logical_now_ns > state.logical_now_ns) state.logical_now_ns = rec.logical_now_ns;

    // Unknown or already completed: late receipts are accepted and ignored
    auto it = state.pending.find(rec.intent_hash);
    if (it == state.pending.end()) return;

    PendingIntent done = it->second;
    state.pending.erase(it);
    state.completed.insert(rec.intent_hash);

    WorkflowInstance* inst = state.find_instance(done.instance_id);
    if (!inst) return;
    inst->inflight.erase(rec.intent_hash);
    if (inst->terminal()) return;
    if (inst->status == InstanceStatus::AwaitingReceipt && done.intent.correlation != inst->await_key) return;

    std::shared_ptr<const Manifest> m = manifest(state.manifest_hash);
    const WorkflowDef* def = m->find(inst->workflow);
    if (!def) {
        reject(state, out, Rejection{height, ErrorKind::NotFound, inst->id(), "workflow left the manifest"});
        return;
    }

    WorkflowEvent ev;
    ev.source = EventSource::Receipt;
    ev.type = done.intent.effect;
    ev.payload = rec.payload;
    ev.correlation = done.intent.correlation;
    ev.status = rec.status;
    ev.intent_kind = done.intent.kind;
    ev.intent_hash = rec.intent_hash;
    ev.logical_now_ns = state.logical_now_ns;
    invoke(state, height, *inst, *def, ev, out);
}

void Kernel::apply_intent(WorldState& state, uint64_t height, const EffectIntent& rec) {
    Hash h = rec.intent_hash();
    auto it = state.pending.find(h);
    if (it == state.pending.end()) {
        throw ReplayMismatchError(state.world_id, height,
                                  "journaled intent " + h.short_hex() + " was not emitted by the fold");
    }
    if (it->second.journaled) {
        throw ReplayMismatchError(state.world_id, height, "intent " + h.short_hex() + " journaled twice");
    }
    ByteWriter folded, journaled;
    encode_intent(folded, it->second.intent);
    encode_intent(journaled, rec);
    if (folded.str() != journaled.str()) {
        throw ReplayMismatchError(state.world_id, height,
                                  "intent " + h.short_hex() + " differs from the re-derived emission");
    }
    it->second.journaled = true;
}

void Kernel::apply_snapshot_marker(const WorldState& state, uint64_t height, const SnapshotMarker& rec) {
    if (rec.height != height) {
        throw ReplayMismatchError(state.world_id, height,
                                  "snapshot marker claims height " + std::to_string(rec.height));
    }
    Hash live = state.state_hash();
    if (live != rec.state_hash) {
        throw ReplayMismatchError(state.world_id, height,
                                  "state hash " + live.short_hex() + " != snapshot " + rec.state_hash.short_hex());
    }
}

void Kernel::apply_manifest_change(WorldState& state, uint64_t height, const ManifestChange& rec,
                                   ApplyResult& out) {
    swap_manifest(state, height, rec.manifest_hash, rec.manifest_hash.hex(), out);
}

bool Kernel::swap_manifest(WorldState& state, uint64_t height, const Hash& target, const std::string& subject,
                           ApplyResult& out) {
    if (target == state.manifest_hash) return true;

    std::vector<std::string> instances = state.non_terminal_instances();
    std::vector<std::string> intents = state.inflight_intents();
    if (!instances.empty() || !intents.empty()) {
        QuiescenceViolationError blocked(instances, intents);
        reject(state, out, Rejection{height, ErrorKind::QuiescenceViolation, subject, blocked.what()});
        return false;
    }
    manifest(target);  // must resolve
    state.manifest_hash = target;
    return true;
}

void Kernel::apply_governance(WorldState& state, uint64_t height, const GovernanceRecord& rec, ApplyResult& out) {
    const std::string subject = "proposal " + std::to_string(rec.proposal_id);

    if (rec.action == GovernanceAction::Propose) {
        if (state.proposals.count(rec.proposal_id)) {
            reject(state, out, Rejection{height, ErrorKind::ProposalInvalid, subject, "id already taken"});
            return;
        }
        Proposal p;
        p.id = rec.proposal_id;
        p.manifest_hash = rec.manifest_hash;
        p.description = rec.description;
        p.proposed_at = height;
        state.proposals.emplace(p.id, p);
        if (p.id >= state.next_proposal_id) state.next_proposal_id = p.id + 1;
        return;
    }

    Proposal* p = state.find_proposal(rec.proposal_id);
    if (!p) {
        reject(state, out, Rejection{height, ErrorKind::NotFound, subject, "no such proposal"});
        return;
    }
    if (const char* needs = proposal_requirement(*p, rec.action)) {
        ProposalStateError err(p->id, proposal_state_name(p->state), needs);
        reject(state, out, Rejection{height, ErrorKind::ProposalInvalid, subject,
                                     std::string(governance_action_name(rec.action)) + ": " + err.what()});
        return;
    }

    switch (rec.action) {
        case GovernanceAction::Shadow:
            p->state = ProposalState::Shadowed;
            p->shadow = rec.shadow;
            p->approver.clear();
            break;
        case GovernanceAction::Approve:
            p->state = ProposalState::Approved;
            p->approver = rec.approver;
            break;
        case GovernanceAction::Reject:
            p->state = ProposalState::Rejected;
            p->approver = rec.approver;
            break;
        case GovernanceAction::Apply:
            // A blocked apply leaves the proposal Approved for a later retry
            if (swap_manifest(state, height, p->manifest_hash, subject, out)) {
                p->state = ProposalState::Applied;
                p->applied_at = height;
            }
            break;
        case GovernanceAction::Propose:
            break;
    }
}

void Kernel::invoke(WorldState& state, uint64_t height, WorkflowInstance& inst, const WorkflowDef& def,
                    const WorkflowEvent& event, ApplyResult& out) {
    InvokeContext ctx;
    ctx.world = state.world_id;
    ctx.workflow = inst.workflow;
    ctx.key = inst.key;
    ctx.height = height;
    ctx.logical_now_ns = state.logical_now_ns;
    if (inst.status == InstanceStatus::AwaitingReceipt) ctx.await_key = inst.await_key;

    ModuleOutput output;
    try {
        output = host_.invoke(def.module, inst.state, event, ctx);
    } catch (const std::exception& e) {
        inst.status = InstanceStatus::Terminal;
        inst.await_key.clear();
        inst.last_error = e.what();
        inst.updated_at = height;
        reject(state, out, Rejection{height, ErrorKind::ModuleFailure, inst.id(), e.what()});
        return;
    }

    inst.state = output.state;
    inst.updated_at = height;

    std::string next_await;
    if (output.directive == Directive::Await) next_await = output.await_key;

    bool denied = false;
    for (const auto& req : output.effects) {
        if (!emit(state, height, inst, req, next_await, out)) denied = true;
    }

    switch (output.directive) {
        case Directive::Complete:
            inst.status = InstanceStatus::Terminal;
            inst.await_key.clear();
            break;
        case Directive::Await:
            inst.status = InstanceStatus::AwaitingReceipt;
            inst.await_key = output.await_key;
            break;
        case Directive::Continue: {
            // Join barrier: stay parked while siblings on the same key are in flight
            bool siblings = false;
            if (inst.status == InstanceStatus::AwaitingReceipt) {
                for (const auto& h : inst.inflight) {
                    auto p = state.pending.find(h);
                    if (p != state.pending.end() && p->second.intent.correlation == inst.await_key) {
                        siblings = true;
                        break;
                    }
                }
            }
            if (!siblings) {
                inst.status = InstanceStatus::Active;
                inst.await_key.clear();
            }
            break;
        }
    }

    // A denied intent fails the instance; nothing would ever answer it
    if (denied) {
        inst.status = InstanceStatus::Terminal;
        inst.await_key.clear();
    }
}

bool Kernel::emit(WorldState& state, uint64_t height, WorkflowInstance& inst, const EffectRequest& req,
                  const std::string& next_await, ApplyResult& out) {
    EffectIntent intent;
    intent.kind = req.kind;
    intent.effect = req.effect;
    intent.params = req.params;
    intent.origin_world = state.world_id;
    intent.origin_workflow = inst.workflow;
    intent.origin_key = inst.key;
    intent.correlation = req.correlation;
    intent.idempotency_key = req.idempotency_key.empty() ? std::to_string(inst.emissions)
                                                         : req.idempotency_key;
    ++inst.emissions;
    if (req.kind == IntentKind::Timer) {
        intent.deliver_at_ns = state.logical_now_ns + req.delay_ns;
    }
    if (req.kind == IntentKind::Fabric) {
        intent.dest_world = req.dest_world.empty() ? state.world_id : req.dest_world;
        intent.dest_workflow = req.dest_workflow;
        intent.dest_key = req.dest_key;
        intent.message_id = req.message_id;
    }
    intent.emitted_at = height;

    try {
        DispatchGuard::check(inst, next_await, intent);
    } catch (const SelfCorrelationCycleError& e) {
        inst.last_error = e.what();
        reject(state, out, Rejection{height, ErrorKind::SelfCorrelationCycle, inst.id(), e.what()});
        return true;
    }

    PolicyVerdict verdict = policy(state.manifest_hash)->decide(intent);
    if (!verdict.allowed()) {
        std::string detail = std::string(intent_kind_name(intent.kind)) + " " + intent.effect + " denied by " +
                             verdict.describe();
        inst.last_error = detail;
        reject(state, out, Rejection{height, ErrorKind::PolicyDenied, inst.id(), detail});
        return false;
    }

    Hash h = intent.intent_hash();
    if (state.pending.count(h) || state.completed.count(h)) {
        reject(state, out, Rejection{height, ErrorKind::DuplicateIntent, inst.id(), h.hex()});
        return true;
    }

    state.pending[h] = PendingIntent{intent, inst.id(), false};
    inst.inflight.insert(h);
    out.emitted.push_back(intent);
    return true;
}

} // namespace loom

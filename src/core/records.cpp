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

#include "records.h"
#include "error.h"

namespace loom {

const char* record_kind_name(RecordKind kind) {
    switch (kind) {
        case RecordKind::Ingress: return "Ingress";
        case RecordKind::EffectIntent: return "EffectIntent";
        case RecordKind::Receipt: return "Receipt";
        case RecordKind::SnapshotMarker: return "SnapshotMarker";
        case RecordKind::ManifestChange: return "ManifestChange";
        case RecordKind::Governance: return "Governance";
    }
    return "Unknown";
}

const char* intent_kind_name(IntentKind kind) {
    switch (kind) {
        case IntentKind::Effect: return "effect";
        case IntentKind::Timer: return "timer";
        case IntentKind::Fabric: return "fabric";
    }
    return "unknown";
}

const char* receipt_status_name(ReceiptStatus status) {
    switch (status) {
        case ReceiptStatus::Ok: return "ok";
        case ReceiptStatus::Error: return "error";
        case ReceiptStatus::Timeout: return "timeout";
    }
    return "unknown";
}

const char* governance_action_name(GovernanceAction action) {
    switch (action) {
        case GovernanceAction::Propose: return "propose";
        case GovernanceAction::Shadow: return "shadow";
        case GovernanceAction::Approve: return "approve";
        case GovernanceAction::Reject: return "reject";
        case GovernanceAction::Apply: return "apply";
    }
    return "unknown";
}

void encode_hash(ByteWriter& w, const Hash& h) {
    w.put_raw(h.bytes.data(), Hash::kSize);
}

Hash decode_hash(ByteReader& r) {
    Hash h;
    r.get_raw(h.bytes.data(), Hash::kSize);
    return h;
}

namespace {

IntentKind to_intent_kind(uint8_t v) {
    if (v < 1 || v > 3) throw CorruptError("bad intent kind " + std::to_string(v));
    return static_cast<IntentKind>(v);
}

ReceiptStatus to_status(uint8_t v) {
    if (v < 1 || v > 3) throw CorruptError("bad receipt status " + std::to_string(v));
    return static_cast<ReceiptStatus>(v);
}

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

void encode_intent_identity(ByteWriter& w, const EffectIntent& i) {
    w.put_u8(static_cast<uint8_t>(i.kind));
    w.put_bytes(i.effect);
    w.put_bytes(i.params);
    w.put_bytes(i.origin_world);
    w.put_bytes(i.origin_workflow);
    w.put_bytes(i.origin_key);
    w.put_bytes(i.correlation);
    w.put_bytes(i.idempotency_key);
    w.put_u64(i.deliver_at_ns);
    w.put_bytes(i.dest_world);
    w.put_bytes(i.dest_workflow);
    w.put_bytes(i.dest_key);
}

} // namespace

Hash EffectIntent::intent_hash() const {
    ByteWriter w;
    w.put_raw("loom.intent.v1", 14);
    encode_intent_identity(w, *this);
    return sha256(w.str());
}

std::string EffectIntent::effective_message_id() const {
    return message_id.empty() ? intent_hash().hex() : message_id;
}

void encode_intent(ByteWriter& w, const EffectIntent& i) {
    encode_intent_identity(w, i);
    w.put_bytes(i.message_id);
    w.put_u64(i.emitted_at);
}

EffectIntent decode_intent(ByteReader& r) {
    EffectIntent i;
    i.kind = to_intent_kind(r.get_u8());
    i.effect = r.get_bytes();
    i.params = r.get_bytes();
    i.origin_world = r.get_bytes();
    i.origin_workflow = r.get_bytes();
    i.origin_key = r.get_bytes();
    i.correlation = r.get_bytes();
    i.idempotency_key = r.get_bytes();
    i.deliver_at_ns = r.get_u64();
    i.dest_world = r.get_bytes();
    i.dest_workflow = r.get_bytes();
    i.dest_key = r.get_bytes();
    i.message_id = r.get_bytes();
    i.emitted_at = r.get_u64();
    return i;
}

JournalRecord JournalRecord::of(const IngressRecord& r) {
    JournalRecord rec;
    rec.kind = RecordKind::Ingress;
    rec.ingress = r;
    return rec;
}

JournalRecord JournalRecord::of(const EffectIntent& r) {
    JournalRecord rec;
    rec.kind = RecordKind::EffectIntent;
    rec.intent = r;
    return rec;
}

JournalRecord JournalRecord::of(const ReceiptRecord& r) {
    JournalRecord rec;
    rec.kind = RecordKind::Receipt;
    rec.receipt = r;
    return rec;
}

JournalRecord JournalRecord::of(const SnapshotMarker& r) {
    JournalRecord rec;
    rec.kind = RecordKind::SnapshotMarker;
    rec.snapshot = r;
    return rec;
}

JournalRecord JournalRecord::of(const ManifestChange& r) {
    JournalRecord rec;
    rec.kind = RecordKind::ManifestChange;
    rec.manifest = r;
    return rec;
}

JournalRecord JournalRecord::of(const GovernanceRecord& r) {
    JournalRecord rec;
    rec.kind = RecordKind::Governance;
    rec.governance = r;
    return rec;
}

std::string JournalRecord::encode() const {
    ByteWriter w;
    w.put_u8(static_cast<uint8_t>(kind));
    switch (kind) {
        case RecordKind::Ingress:
            w.put_u8(static_cast<uint8_t>(ingress.kind));
            w.put_bytes(ingress.ingress_id);
            w.put_bytes(ingress.event_type);
            w.put_bytes(ingress.instance_key);
            w.put_bytes(ingress.correlation);
            w.put_bytes(ingress.payload);
            w.put_bytes(ingress.source_world);
            w.put_bytes(ingress.dest_workflow);
            w.put_u64(ingress.logical_now_ns);
            break;
        case RecordKind::EffectIntent:
            encode_intent(w, intent);
            break;
        case RecordKind::Receipt:
            encode_hash(w, receipt.intent_hash);
            w.put_u8(static_cast<uint8_t>(receipt.kind));
            w.put_u8(static_cast<uint8_t>(receipt.status));
            w.put_bytes(receipt.adapter_id);
            w.put_bytes(receipt.payload);
            w.put_bytes(receipt.correlation);
            w.put_u64(receipt.logical_now_ns);
            break;
        case RecordKind::SnapshotMarker:
            encode_hash(w, snapshot.snapshot_ref);
            w.put_u64(snapshot.height);
            encode_hash(w, snapshot.state_hash);
            encode_hash(w, snapshot.manifest_hash);
            break;
        case RecordKind::ManifestChange:
            encode_hash(w, manifest.manifest_hash);
            break;
        case RecordKind::Governance:
            w.put_u8(static_cast<uint8_t>(governance.action));
            w.put_u64(governance.proposal_id);
            encode_hash(w, governance.manifest_hash);
            w.put_bytes(governance.description);
            w.put_bytes(governance.approver);
            put_strings(w, governance.shadow.predicted_effects);
            put_strings(w, governance.shadow.rejections);
            put_strings(w, governance.shadow.workflow_deltas);
            put_strings(w, governance.shadow.blockers);
            break;
    }
    return w.take();
}

JournalRecord JournalRecord::decode(const std::string& bytes) {
    ByteReader r(bytes, "journal record");
    JournalRecord rec;
    uint8_t kind = r.get_u8();
    if (kind < 1 || kind > 6) throw CorruptError("bad record kind " + std::to_string(kind));
    rec.kind = static_cast<RecordKind>(kind);
    switch (rec.kind) {
        case RecordKind::Ingress: {
            uint8_t ik = r.get_u8();
            if (ik < 1 || ik > 2) throw CorruptError("bad ingress kind " + std::to_string(ik));
            rec.ingress.kind = static_cast<IngressKind>(ik);
            rec.ingress.ingress_id = r.get_bytes();
            rec.ingress.event_type = r.get_bytes();
            rec.ingress.instance_key = r.get_bytes();
            rec.ingress.correlation = r.get_bytes();
            rec.ingress.payload = r.get_bytes();
            rec.ingress.source_world = r.get_bytes();
            rec.ingress.dest_workflow = r.get_bytes();
            rec.ingress.logical_now_ns = r.get_u64();
            break;
        }
        case RecordKind::EffectIntent:
            rec.intent = decode_intent(r);
            break;
        case RecordKind::Receipt:
            rec.receipt.intent_hash = decode_hash(r);
            rec.receipt.kind = to_intent_kind(r.get_u8());
            rec.receipt.status = to_status(r.get_u8());
            rec.receipt.adapter_id = r.get_bytes();
            rec.receipt.payload = r.get_bytes();
            rec.receipt.correlation = r.get_bytes();
            rec.receipt.logical_now_ns = r.get_u64();
            break;
        case RecordKind::SnapshotMarker:
            rec.snapshot.snapshot_ref = decode_hash(r);
            rec.snapshot.height = r.get_u64();
            rec.snapshot.state_hash = decode_hash(r);
            rec.snapshot.manifest_hash = decode_hash(r);
            break;
        case RecordKind::ManifestChange:
            rec.manifest.manifest_hash = decode_hash(r);
            break;
        case RecordKind::Governance: {
            uint8_t action = r.get_u8();
            if (action < 1 || action > 5) throw CorruptError("bad governance action " + std::to_string(action));
            rec.governance.action = static_cast<GovernanceAction>(action);
            rec.governance.proposal_id = r.get_u64();
            rec.governance.manifest_hash = decode_hash(r);
            rec.governance.description = r.get_bytes();
            rec.governance.approver = r.get_bytes();
            rec.governance.shadow.predicted_effects = get_strings(r);
            rec.governance.shadow.rejections = get_strings(r);
            rec.governance.shadow.workflow_deltas = get_strings(r);
            rec.governance.shadow.blockers = get_strings(r);
            break;
        }
    }
    r.expect_done();
    return rec;
}

std::string JournalRecord::describe() const {
    std::string out = record_kind_name(kind);
    switch (kind) {
        case RecordKind::Ingress:
            out += "(" + ingress.event_type + " key=" + ingress.instance_key + ")";
            break;
        case RecordKind::EffectIntent:
            out += "(" + std::string(intent_kind_name(intent.kind)) + " " + intent.effect + " " +
                   intent.intent_hash().short_hex() + ")";
            break;
        case RecordKind::Receipt:
            out += "(" + receipt.intent_hash.short_hex() + " " + receipt_status_name(receipt.status) + ")";
            break;
        case RecordKind::SnapshotMarker:
            out += "(" + snapshot.snapshot_ref.short_hex() + " @" + std::to_string(snapshot.height) + ")";
            break;
        case RecordKind::ManifestChange:
            out += "(" + manifest.manifest_hash.short_hex() + ")";
            break;
        case RecordKind::Governance:
            out += "(" + std::string(governance_action_name(governance.action)) + " #" +
                   std::to_string(governance.proposal_id) + ")";
            break;
    }
    return out;
}

} // namespace loom

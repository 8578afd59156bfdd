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
#include "hash.h"
#include "wire.h"

namespace loom {

enum class RecordKind : uint8_t {
    Ingress = 1,
    EffectIntent = 2,
    Receipt = 3,
    SnapshotMarker = 4,
    ManifestChange = 5,
    Governance = 6
};

enum class IngressKind : uint8_t {
    Event = 1,    // external event submission
    Fabric = 2    // message from another (or the same) world
};

enum class IntentKind : uint8_t {
    Effect = 1,
    Timer = 2,
    Fabric = 3
};

enum class ReceiptStatus : uint8_t {
    Ok = 1,
    Error = 2,
    Timeout = 3
};

enum class GovernanceAction : uint8_t {
    Propose = 1,
    Shadow = 2,
    Approve = 3,
    Reject = 4,
    Apply = 5
};

const char* record_kind_name(RecordKind kind);
const char* intent_kind_name(IntentKind kind);
const char* receipt_status_name(ReceiptStatus status);
const char* governance_action_name(GovernanceAction action);

struct IngressRecord {
    IngressKind kind = IngressKind::Event;
    std::string ingress_id;       // producer-chosen, used as the inbox dedupe id
    std::string event_type;
    std::string instance_key;
    std::string correlation;
    std::string payload;
    std::string source_world;     // fabric only
    std::string dest_workflow;    // fabric only
    uint64_t logical_now_ns = 0;  // stamped when drained into the journal
};

/**
 * A request for external work emitted by a workflow instance.
 *
 * The intent hash covers the identity fields only (kind through dest_key);
 * message_id and emitted_at are carried but not hashed. The hash is the
 * idempotency anchor for all three delivery pipelines.
 */
struct EffectIntent {
    IntentKind kind = IntentKind::Effect;
    std::string effect;
    std::string params;
    std::string origin_world;
    std::string origin_workflow;
    std::string origin_key;
    std::string correlation;
    std::string idempotency_key;
    uint64_t deliver_at_ns = 0;   // timers: logical deadline
    std::string dest_world;       // fabric
    std::string dest_workflow;    // fabric
    std::string dest_key;         // fabric
    std::string message_id;       // fabric; empty means the intent hash
    uint64_t emitted_at = 0;      // height of the record whose fold emitted it

    Hash intent_hash() const;
    std::string effective_message_id() const;
    std::string origin_instance() const { return origin_workflow + "/" + origin_key; }
};

struct ReceiptRecord {
    Hash intent_hash;
    IntentKind kind = IntentKind::Effect;
    ReceiptStatus status = ReceiptStatus::Ok;
    std::string adapter_id;
    std::string payload;
    std::string correlation;
    uint64_t logical_now_ns = 0;
};

struct SnapshotMarker {
    Hash snapshot_ref;
    uint64_t height = 0;
    Hash state_hash;
    Hash manifest_hash;
};

struct ManifestChange {
    Hash manifest_hash;
};

// What a dry run of a proposed manifest predicts. Recorded, never re-derived.
struct ShadowSummary {
    std::vector<std::string> predicted_effects;  // kind:effect:intent hash
    std::vector<std::string> rejections;         // kind subject
    std::vector<std::string> workflow_deltas;    // +added -removed ~changed
    std::vector<std::string> blockers;           // what the live world would block apply on
};

/**
 * One step of a manifest proposal. Propose names the candidate manifest,
 * Shadow carries its dry-run summary, Approve and Reject carry the
 * approver, Apply swaps the manifest in behind the quiescence gate.
 */
struct GovernanceRecord {
    GovernanceAction action = GovernanceAction::Propose;
    uint64_t proposal_id = 0;
    Hash manifest_hash;        // propose
    std::string description;   // propose
    std::string approver;      // approve, reject
    ShadowSummary shadow;      // shadow
};

/**
 * One journal entry. Only the member selected by kind is meaningful and
 * only that member is encoded.
 */
struct JournalRecord {
    RecordKind kind = RecordKind::Ingress;
    IngressRecord ingress;
    EffectIntent intent;
    ReceiptRecord receipt;
    SnapshotMarker snapshot;
    ManifestChange manifest;
    GovernanceRecord governance;

    static JournalRecord of(const IngressRecord& r);
    static JournalRecord of(const EffectIntent& r);
    static JournalRecord of(const ReceiptRecord& r);
    static JournalRecord of(const SnapshotMarker& r);
    static JournalRecord of(const ManifestChange& r);
    static JournalRecord of(const GovernanceRecord& r);

    std::string encode() const;
    static JournalRecord decode(const std::string& bytes);

    std::string describe() const;
};

struct JournalEntry {
    uint64_t height = 0;
    JournalRecord record;
};

void encode_intent(ByteWriter& w, const EffectIntent& intent);
EffectIntent decode_intent(ByteReader& r);

void encode_hash(ByteWriter& w, const Hash& h);
Hash decode_hash(ByteReader& r);

} // namespace loom

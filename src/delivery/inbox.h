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
#include "../core/records.h"
#include "../persistence/kv_store.h"

namespace loom {

enum class EnqueueOutcome : uint8_t {
    Enqueued = 1,
    AlreadyEnqueued = 2
};

struct InboxEntry {
    uint64_t seq = 0;
    std::string dedupe_id;
    JournalRecord record;   // Ingress, Receipt, ManifestChange or Governance
};

// One message bound for a world's inbox
struct InboxDelivery {
    std::string world;
    std::string dedupe_id;
    JournalRecord record;
};

/**
 * Per-world durable queue of records waiting to be journaled by the
 * world's lease holder.
 *
 *   world/<id>/inbox/<seq>           entry
 *   world/<id>/inbox_seq             next sequence number
 *   world/<id>/inbox_dedupe/<id>     present once an id was ever enqueued
 *
 * The dedupe table outlives consumption, so a retried send of the same id
 * is reported as already enqueued forever.
 */
class Inbox {
public:
    explicit Inbox(persist::KvStore& kv);

    // Commits on its own; retries sequence races
    EnqueueOutcome enqueue(const std::string& world, const std::string& dedupe_id, const JournalRecord& record);

    /**
     * Adds the enqueue to txn. The dedupe check is part of txn, so a
     * concurrent enqueue of the same id makes the commit fail rather than
     * deliver twice.
     */
    EnqueueOutcome stage(persist::Transaction& txn, const std::string& world, const std::string& dedupe_id,
                         const JournalRecord& record) const;

    std::vector<InboxEntry> peek(const std::string& world, size_t limit) const;
    void stage_consume(persist::Transaction& txn, const std::string& world, const InboxEntry& entry) const;
    size_t depth(const std::string& world) const;
    bool seen(const std::string& world, const std::string& dedupe_id) const;

    static std::string entry_prefix(const std::string& world) { return "world/" + world + "/inbox/"; }
    static std::string entry_key(const std::string& world, uint64_t seq);
    static std::string seq_key(const std::string& world) { return "world/" + world + "/inbox_seq"; }
    static std::string dedupe_key(const std::string& world, const std::string& id) {
        return "world/" + world + "/inbox_dedupe/" + id;
    }

    static std::string receipt_id(const Hash& intent_hash) { return "receipt:" + intent_hash.hex(); }
    static std::string message_id(const std::string& id) { return "msg:" + id; }

private:
    persist::KvStore& kv_;
};

} // namespace loom

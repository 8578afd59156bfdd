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

#include "inbox.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../persistence/config.h"
#include "../util/log.h"
#include <cstdio>
#include <cstdlib>

namespace loom {

namespace {

std::string encode_seq(uint64_t v) {
    ByteWriter w;
    w.put_u64(v);
    return w.take();
}

uint64_t decode_seq(const std::string& raw) {
    ByteReader r(raw, "inbox seq");
    uint64_t v = r.get_u64();
    r.expect_done();
    return v;
}

std::string encode_entry(const std::string& dedupe_id, const JournalRecord& record) {
    ByteWriter w;
    w.put_bytes(dedupe_id);
    w.put_bytes(record.encode());
    return w.take();
}

} // namespace

Inbox::Inbox(persist::KvStore& kv) : kv_(kv) {}

std::string Inbox::entry_key(const std::string& world, uint64_t seq) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%0*llu", persist::journal::kHeightDigits, static_cast<unsigned long long>(seq));
    return entry_prefix(world) + buf;
}

EnqueueOutcome Inbox::stage(persist::Transaction& txn, const std::string& world, const std::string& dedupe_id,
                            const JournalRecord& record) const {
    const std::string dkey = dedupe_key(world, dedupe_id);
    if (txn.staged(dkey, nullptr, nullptr) || kv_.get(dkey, nullptr)) {
        return EnqueueOutcome::AlreadyEnqueued;
    }

    const std::string skey = seq_key(world);
    std::string staged;
    uint64_t seq = 0;
    if (txn.staged(skey, &staged, nullptr)) {
        seq = decode_seq(staged);
    } else {
        std::string committed;
        bool exists = kv_.get(skey, &committed);
        if (exists) seq = decode_seq(committed);
        txn.expect_unchanged(skey, exists ? &committed : nullptr);
    }

    txn.expect_absent(dkey);
    txn.put(dkey, std::string());
    txn.put(entry_key(world, seq), encode_entry(dedupe_id, record));
    txn.put(skey, encode_seq(seq + 1));
    return EnqueueOutcome::Enqueued;
}

EnqueueOutcome Inbox::enqueue(const std::string& world, const std::string& dedupe_id, const JournalRecord& record) {
    for (int attempt = 0; ; ++attempt) {
        persist::Transaction txn;
        EnqueueOutcome outcome = stage(txn, world, dedupe_id, record);
        if (outcome == EnqueueOutcome::AlreadyEnqueued) return outcome;
        try {
            kv_.commit(txn);
            return outcome;
        } catch (const CommitConflictError&) {
            if (attempt + 1 >= persist::delivery::kAckRetries) throw;
            debug() << "inbox " << world << " enqueue of " << dedupe_id << " raced, retrying";
        }
    }
}

std::vector<InboxEntry> Inbox::peek(const std::string& world, size_t limit) const {
    std::vector<InboxEntry> out;
    for (const auto& kv : kv_.scan(entry_prefix(world), limit)) {
        InboxEntry e;
        e.seq = std::strtoull(kv.key.c_str() + entry_prefix(world).size(), nullptr, 10);
        ByteReader r(kv.value, "inbox entry");
        e.dedupe_id = r.get_bytes();
        e.record = JournalRecord::decode(r.get_bytes());
        r.expect_done();
        out.push_back(std::move(e));
    }
    return out;
}

void Inbox::stage_consume(persist::Transaction& txn, const std::string& world, const InboxEntry& entry) const {
    std::string key = entry_key(world, entry.seq);
    txn.expect_present(key);
    txn.erase(key);
}

size_t Inbox::depth(const std::string& world) const {
    return kv_.scan(entry_prefix(world)).size();
}

bool Inbox::seen(const std::string& world, const std::string& dedupe_id) const {
    return kv_.get(dedupe_key(world, dedupe_id), nullptr);
}

} // namespace loom

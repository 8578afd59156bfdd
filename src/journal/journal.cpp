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

#include "journal.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../persistence/config.h"
#include "../util/log.h"
#include <cstdio>
#include <cstdlib>

namespace loom {

namespace {

std::string encode_height(uint64_t h) {
    ByteWriter w;
    w.put_u64(h);
    return w.take();
}

uint64_t decode_height(const std::string& raw) {
    ByteReader r(raw, "journal head");
    uint64_t h = r.get_u64();
    r.expect_done();
    return h;
}

} // namespace

Journal::Journal(persist::KvStore& kv, const LeaseManager& leases)
    : kv_(kv), leases_(leases) {}

uint64_t Journal::segment_of(uint64_t height) {
    return height / persist::journal::kSegmentSpan;
}

std::string Journal::entry_key(const std::string& world, uint64_t height) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%0*llu/%0*llu",
             persist::journal::kSegmentDigits, static_cast<unsigned long long>(segment_of(height)),
             persist::journal::kHeightDigits, static_cast<unsigned long long>(height));
    return prefix(world) + buf;
}

uint64_t Journal::height_from_key(const std::string& key) {
    size_t slash = key.rfind('/');
    if (slash == std::string::npos || slash + 1 >= key.size()) {
        throw CorruptError("malformed journal key " + key);
    }
    return std::strtoull(key.c_str() + slash + 1, nullptr, 10);
}

uint64_t Journal::head(const std::string& world) const {
    std::string raw;
    if (!kv_.get(head_key(world), &raw)) return 0;
    return decode_height(raw);
}

uint64_t Journal::first_height(const std::string& world) const {
    std::vector<persist::KvPair> first = kv_.scan(prefix(world), 1);
    if (first.empty()) return head(world);
    return height_from_key(first.front().key);
}

void Journal::stage_head_check(persist::Transaction& txn, const std::string& world,
                               uint64_t expected_height) const {
    txn.expect(head_key(world),
               [expected_height](const std::string* cur) {
                   uint64_t actual = cur ? decode_height(*cur) : 0;
                   return actual == expected_height;
               },
               [world, expected_height](const std::string&, const std::string* cur) {
                   throw StaleHeightError(world, expected_height, cur ? decode_height(*cur) : 0);
               });
}

uint64_t Journal::stage_append(persist::Transaction& txn, const std::string& world, uint64_t epoch,
                               uint64_t expected_height, const JournalRecord& record) const {
    // A second append to the same world in one transaction chains off the staged head
    std::string staged;
    bool erased = false;
    if (txn.staged(head_key(world), &staged, &erased) && !erased) {
        uint64_t next = decode_height(staged);
        if (next != expected_height) throw StaleHeightError(world, expected_height, next);
    } else {
        leases_.fence(txn, world, epoch);
        stage_head_check(txn, world, expected_height);
    }
    std::string key = entry_key(world, expected_height);
    txn.expect_absent(key);
    txn.put(key, record.encode());
    txn.put(head_key(world), encode_height(expected_height + 1));
    return expected_height;
}

void Journal::stage_initial(persist::Transaction& txn, const std::string& world, uint64_t height,
                            const JournalRecord& record) const {
    txn.expect_absent(head_key(world));
    std::string key = entry_key(world, height);
    txn.expect_absent(key);
    txn.put(key, record.encode());
    txn.put(head_key(world), encode_height(height + 1));
}

uint64_t Journal::append(const std::string& world, uint64_t epoch, uint64_t expected_height,
                         const JournalRecord& record) {
    persist::Transaction txn;
    uint64_t h = stage_append(txn, world, epoch, expected_height, record);
    kv_.commit(txn);
    trace() << "journal " << world << " @" << h << " " << record.describe();
    return h;
}

uint64_t Journal::append_batch(const std::string& world, uint64_t epoch, uint64_t expected_height,
                               const std::vector<JournalRecord>& records) {
    if (records.empty()) return expected_height;
    persist::Transaction txn;
    uint64_t h = expected_height;
    for (const auto& rec : records) {
        stage_append(txn, world, epoch, h, rec);
        ++h;
    }
    kv_.commit(txn);
    trace() << "journal " << world << " appended " << records.size() << " record(s) up to @" << (h - 1);
    return h;
}

std::vector<JournalEntry> Journal::read(const std::string& world, uint64_t from, size_t limit) const {
    std::vector<JournalEntry> out;
    for (const auto& kv : kv_.scan_from(prefix(world), entry_key(world, from), limit)) {
        JournalEntry e;
        e.height = height_from_key(kv.key);
        e.record = JournalRecord::decode(kv.value);
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace loom

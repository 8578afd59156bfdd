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
#include "../lease/lease_manager.h"
#include "../persistence/kv_store.h"

namespace loom {

/**
 * Append-only, per-world record log.
 *
 * Entries live at world/<id>/journal/<segment>/<height>, both zero padded
 * so a prefix scan yields height order; the segment is height / span.
 * world/<id>/head holds the next height to be written. Every append
 * checks the head and the writer's lease epoch inside the same
 * transaction that writes the entry.
 */
class Journal {
public:
    Journal(persist::KvStore& kv, const LeaseManager& leases);

    // Returns the height assigned. Throws StaleHeightError or FencedWriteError.
    uint64_t append(const std::string& world, uint64_t epoch, uint64_t expected_height,
                    const JournalRecord& record);

    // Appends records at expected_height, expected_height + 1, ...; returns the new head
    uint64_t append_batch(const std::string& world, uint64_t epoch, uint64_t expected_height,
                          const std::vector<JournalRecord>& records);

    // Adds an append to a caller transaction; returns the height it will occupy
    uint64_t stage_append(persist::Transaction& txn, const std::string& world, uint64_t epoch,
                          uint64_t expected_height, const JournalRecord& record) const;

    /**
     * Writes the first entry of a world that starts above genesis (a fork).
     * No lease exists yet; the head must be absent.
     */
    void stage_initial(persist::Transaction& txn, const std::string& world, uint64_t height,
                       const JournalRecord& record) const;

    uint64_t head(const std::string& world) const;
    // Lowest retained height; equals head() for an empty journal
    uint64_t first_height(const std::string& world) const;

    std::vector<JournalEntry> read(const std::string& world, uint64_t from, size_t limit = 0) const;

    static std::string head_key(const std::string& world) { return "world/" + world + "/head"; }
    static std::string prefix(const std::string& world) { return "world/" + world + "/journal/"; }
    static std::string entry_key(const std::string& world, uint64_t height);
    static uint64_t segment_of(uint64_t height);

private:
    void stage_head_check(persist::Transaction& txn, const std::string& world, uint64_t expected_height) const;
    static uint64_t height_from_key(const std::string& key);

    persist::KvStore& kv_;
    const LeaseManager& leases_;
};

} // namespace loom

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
#include "journal.h"
#include "../kernel/kernel.h"
#include "../snapshot/snapshot_manager.h"

namespace loom {

struct RestoreStats {
    bool from_baseline = false;
    uint64_t baseline_height = 0;
    uint64_t records_folded = 0;
};

struct VerifyReport {
    bool from_genesis = false;   // false when history below the first retained height is gone
    uint64_t height = 0;
    Hash state_hash;
};

/**
 * Rebuilds world state from the restore floor. Holds no state of its own;
 * the worker and the catalog each use one.
 */
class Replayer {
public:
    Replayer(const Journal& journal, const SnapshotManager& snapshots, Kernel& kernel);

    /**
     * Baseline + contiguous tail, or genesis + full journal when no
     * baseline exists. Throws JournalGapError when the tail does not start
     * at the baseline height or has holes; ReplayMismatchError and
     * RootIncompleteError propagate.
     */
    WorldState restore(const std::string& world, RestoreStats* stats = nullptr) const;

    // Fold entries [state.height, head) onto state; returns records folded
    uint64_t fold_tail(WorldState& state, size_t batch = 512) const;

    // Same, stopping at until; JournalGapError if until is past the head
    uint64_t fold_until(WorldState& state, uint64_t until, size_t batch = 512) const;

    WorldState fold_from_genesis(const std::string& world) const;

    /**
     * Checks fold(genesis, full) == fold(baseline, tail) at the head.
     * Throws ReplayMismatchError on divergence.
     */
    VerifyReport verify(const std::string& world) const;

private:
    const Journal& journal_;
    const SnapshotManager& snapshots_;
    Kernel& kernel_;
};

} // namespace loom

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

#include "replay.h"
#include "../core/error.h"
#include "../util/log.h"

namespace loom {

Replayer::Replayer(const Journal& journal, const SnapshotManager& snapshots, Kernel& kernel)
    : journal_(journal), snapshots_(snapshots), kernel_(kernel) {}

uint64_t Replayer::fold_tail(WorldState& state, size_t batch) const {
    return fold_until(state, journal_.head(state.world_id), batch);
}

uint64_t Replayer::fold_until(WorldState& state, uint64_t until, size_t batch) const {
    const uint64_t head = journal_.head(state.world_id);
    if (until > head) {
        throw JournalGapError(state.world_id, head, "fold requested up to " + std::to_string(until));
    }
    uint64_t folded = 0;
    while (state.height < until) {
        std::vector<JournalEntry> entries = journal_.read(state.world_id, state.height, batch);
        if (entries.empty() || entries.front().height != state.height) {
            throw JournalGapError(state.world_id, state.height,
                                  entries.empty() ? "tail ends before head " + std::to_string(head)
                                                  : "next retained height is " +
                                                    std::to_string(entries.front().height));
        }
        for (const auto& e : entries) {
            if (e.height >= until) break;
            if (e.height != state.height) {
                throw JournalGapError(state.world_id, state.height,
                                      "hole before height " + std::to_string(e.height));
            }
            kernel_.apply(state, e.height, e.record);
            ++folded;
        }
    }
    return folded;
}

WorldState Replayer::fold_from_genesis(const std::string& world) const {
    WorldState state = kernel_.genesis(world);
    fold_tail(state);
    return state;
}

WorldState Replayer::restore(const std::string& world, RestoreStats* stats) const {
    RestoreStats local;
    WorldState state;

    BaselineRecord base;
    if (snapshots_.baseline(world, &base)) {
        SnapshotEnvelope env = snapshots_.load_envelope(base.snapshot_ref);
        state = snapshots_.load_state(env);
        if (state.world_id != world) {
            throw ReplayMismatchError(world, base.height, "baseline belongs to world " + state.world_id);
        }
        local.from_baseline = true;
        local.baseline_height = base.height;
    } else {
        state = kernel_.genesis(world);
    }

    local.records_folded = fold_tail(state);
    info() << "restored " << world << " to height " << state.height
           << (local.from_baseline ? " from baseline @" + std::to_string(local.baseline_height) : " from genesis")
           << " (" << local.records_folded << " records folded)";
    if (stats) *stats = local;
    return state;
}

VerifyReport Replayer::verify(const std::string& world) const {
    VerifyReport report;
    WorldState restored = restore(world);
    report.height = restored.height;
    report.state_hash = restored.state_hash();

    if (journal_.first_height(world) != 0) {
        warning() << "verify " << world << ": history below height " << journal_.first_height(world)
                  << " is not retained; checked baseline restore only";
        return report;
    }

    WorldState full = fold_from_genesis(world);
    report.from_genesis = true;
    if (full.height != restored.height || full.state_hash() != report.state_hash) {
        throw ReplayMismatchError(world, restored.height,
                                  "genesis fold " + full.state_hash().short_hex() + " != baseline fold " +
                                  report.state_hash.short_hex());
    }
    return report;
}

} // namespace loom

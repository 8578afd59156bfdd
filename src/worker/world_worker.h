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
#include <set>
#include <string>
#include "runtime_config.h"
#include "world_services.h"

namespace loom {

enum class WorkerState : uint8_t {
    Idle = 1,
    Acquiring,
    Restoring,
    Running,
    Fenced,
    Released
};

const char* worker_state_name(WorkerState s);

struct WorkerOptions {
    std::string worker_id;
    size_t step_budget = persist::worker::kDefaultStepBudget;
    size_t inbox_batch = persist::worker::kDefaultInboxBatch;
    uint64_t snapshot_every = persist::worker::kDefaultSnapshotEvery;   // 0 disables snapshots

    static WorkerOptions from(const RuntimeConfig& cfg);
};

struct StepReport {
    size_t drained = 0;            // inbox entries consumed
    size_t folded = 0;             // records appended and folded
    size_t intents_journaled = 0;
    size_t published = 0;
    bool snapshotted = false;
    bool promoted = false;
};

/**
 * Drives one world: lease, restore, inbox drain, fold, intent journaling,
 * publication, snapshots. Only ever mutates through epoch-fenced calls;
 * once fenced it stops issuing writes for good. Not thread safe; one
 * thread steps a given worker.
 */
class WorldWorker {
public:
    WorldWorker(std::string world, WorldServices& services, WorkerOptions options);

    /**
     * One bounded cycle. A FencedWriteError or failed renewal moves the
     * worker to Fenced. ReplayMismatchError halts the worker and is
     * rethrown.
     */
    StepReport step();

    // Gives up the lease; the worker ends Released
    void release();

    WorkerState state() const { return state_; }
    bool halted() const { return halted_; }
    bool resident() const { return resident_; }
    uint64_t epoch() const { return epoch_; }
    const std::string& world() const { return world_; }
    const WorldState& world_state() const { return ws_; }

private:
    void restore();
    void run(StepReport& report);
    size_t drain(size_t budget, StepReport& report);
    void journal_intents(StepReport& report);
    void publish_intents(StepReport& report);
    void maybe_snapshot(StepReport& report);
    void fence(const std::string& why);

    std::string world_;
    WorldServices& svc_;
    WorkerOptions opts_;

    WorkerState state_ = WorkerState::Idle;
    bool halted_ = false;
    bool resident_ = false;
    uint64_t epoch_ = 0;
    WorldState ws_;
    std::set<Hash> published_;
    uint64_t since_snapshot_ = 0;
    Hash promotion_candidate_;
};

} // namespace loom

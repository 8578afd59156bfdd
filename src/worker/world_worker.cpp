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

#include "world_worker.h"
#include "../core/error.h"
#include "../util/log.h"
#include <algorithm>

namespace loom {

const char* worker_state_name(WorkerState s) {
    switch (s) {
        case WorkerState::Idle: return "Idle";
        case WorkerState::Acquiring: return "Acquiring";
        case WorkerState::Restoring: return "Restoring";
        case WorkerState::Running: return "Running";
        case WorkerState::Fenced: return "Fenced";
        case WorkerState::Released: return "Released";
    }
    return "Unknown";
}

WorkerOptions WorkerOptions::from(const RuntimeConfig& cfg) {
    WorkerOptions o;
    o.worker_id = cfg.worker_id;
    o.step_budget = cfg.step_budget;
    o.inbox_batch = cfg.inbox_batch;
    o.snapshot_every = cfg.snapshot_every;
    return o;
}

WorldWorker::WorldWorker(std::string world, WorldServices& services, WorkerOptions options)
    : world_(std::move(world)), svc_(services), opts_(std::move(options)) {}

StepReport WorldWorker::step() {
    StepReport report;
    if (halted_ || state_ == WorkerState::Fenced || state_ == WorkerState::Released) return report;

    try {
        if (epoch_ == 0) {
            state_ = WorkerState::Acquiring;
            LeaseGrant grant = svc_.leases.acquire(world_, opts_.worker_id);
            if (!grant.granted) {
                state_ = WorkerState::Idle;
                return report;
            }
            epoch_ = grant.epoch;
            resident_ = false;
        } else if (!svc_.leases.renew(world_, opts_.worker_id, epoch_)) {
            fence("lease renewal refused");
            return report;
        }

        if (!resident_) {
            state_ = WorkerState::Restoring;
            restore();
        }
        state_ = WorkerState::Running;
        run(report);

        if (!svc_.leases.renew(world_, opts_.worker_id, epoch_)) {
            fence("lease renewal refused");
        }
    } catch (const FencedWriteError& e) {
        fence(e.what());
    } catch (const ReplayMismatchError& e) {
        halted_ = true;
        resident_ = false;
        severe() << "world " << world_ << " halted: " << e.what();
        throw;
    } catch (const std::exception& e) {
        // State may be behind the journal now; rebuild on the next step
        resident_ = false;
        error() << "world " << world_ << " step failed: " << e.what();
        throw;
    }
    return report;
}

void WorldWorker::release() {
    if (epoch_ == 0 || state_ == WorkerState::Fenced || state_ == WorkerState::Released) return;
    if (!svc_.leases.release(world_, opts_.worker_id, epoch_)) {
        warning() << "world " << world_ << ": release at epoch " << epoch_ << " found the lease already gone";
    }
    state_ = WorkerState::Released;
    resident_ = false;
}

void WorldWorker::fence(const std::string& why) {
    warning() << "world " << world_ << " fenced at epoch " << epoch_ << " (" << opts_.worker_id << "): " << why;
    state_ = WorkerState::Fenced;
    resident_ = false;
}

void WorldWorker::restore() {
    RestoreStats stats;
    ws_ = svc_.replayer.restore(world_, &stats);
    published_.clear();
    since_snapshot_ = 0;
    promotion_candidate_ = Hash();
    resident_ = true;
}

void WorldWorker::run(StepReport& report) {
    // Only drain once caught up with the journal
    report.folded += svc_.replayer.fold_tail(ws_);

    size_t budget = opts_.step_budget;
    while (budget > 0) {
        size_t used = drain(budget, report);
        journal_intents(report);
        if (used == 0) break;
        budget -= std::min(budget, used);
    }

    publish_intents(report);
    maybe_snapshot(report);
}

size_t WorldWorker::drain(size_t budget, StepReport& report) {
    std::vector<InboxEntry> entries = svc_.inbox.peek(world_, std::min(budget, opts_.inbox_batch));
    const uint64_t now = svc_.clock.now_ns();

    for (auto& entry : entries) {
        // Ingress takes its time from the drain; receipts keep the time their executor gave them
        JournalRecord rec = entry.record;
        if (rec.kind == RecordKind::Ingress) {
            rec.ingress.logical_now_ns = std::max(rec.ingress.logical_now_ns, now);
        }

        // A second receipt for a completed intent is consumed without journaling
        bool skip = rec.kind == RecordKind::Receipt && ws_.completed.count(rec.receipt.intent_hash) != 0;

        persist::Transaction txn;
        svc_.inbox.stage_consume(txn, world_, entry);
        const uint64_t height = ws_.height;
        if (!skip) svc_.journal.stage_append(txn, world_, epoch_, height, rec);
        svc_.kv.commit(txn);
        ++report.drained;

        if (skip) {
            debug() << "world " << world_ << " dropped duplicate receipt " << entry.dedupe_id;
            continue;
        }
        ApplyResult res = svc_.kernel.apply(ws_, height, rec);
        ++report.folded;
        ++since_snapshot_;
        trace() << "world " << world_ << " @" << height << " " << rec.describe() << " -> "
                << res.emitted.size() << " intent(s), " << res.rejections.size() << " rejection(s)";
    }
    return entries.size();
}

void WorldWorker::journal_intents(StepReport& report) {
    std::vector<const PendingIntent*> fresh = ws_.unjournaled();
    if (fresh.empty()) return;

    std::vector<JournalRecord> records;
    records.reserve(fresh.size());
    for (const PendingIntent* p : fresh) records.push_back(JournalRecord::of(p->intent));

    const uint64_t first = ws_.height;
    svc_.journal.append_batch(world_, epoch_, first, records);
    for (size_t i = 0; i < records.size(); ++i) {
        svc_.kernel.apply(ws_, first + i, records[i]);
    }
    report.intents_journaled += records.size();
    report.folded += records.size();
    since_snapshot_ += records.size();
}

void WorldWorker::publish_intents(StepReport& report) {
    for (auto it = published_.begin(); it != published_.end();) {
        if (ws_.pending.count(*it)) ++it;
        else it = published_.erase(it);
    }
    for (const auto& kv : ws_.pending) {
        if (!kv.second.journaled || published_.count(kv.first)) continue;
        const EffectIntent& intent = kv.second.intent;
        if (svc_.queue(pipeline_for(intent.kind)).publish(world_, epoch_, intent)) ++report.published;
        published_.insert(kv.first);
    }
}

void WorldWorker::maybe_snapshot(StepReport& report) {
    if (opts_.snapshot_every && since_snapshot_ >= opts_.snapshot_every) {
        SnapshotResult snap = svc_.snapshots.create_snapshot(ws_, epoch_);
        svc_.kernel.apply(ws_, snap.marker_height, snap.marker);
        since_snapshot_ = 0;
        report.snapshotted = true;
        promotion_candidate_ = snap.snapshot_ref;
    }
    if (promotion_candidate_.is_zero()) return;

    try {
        if (svc_.snapshots.promote_baseline(world_, epoch_, promotion_candidate_, ws_)) report.promoted = true;
        promotion_candidate_ = Hash();
    } catch (const ReceiptHorizonViolationError& e) {
        debug() << "world " << world_ << " keeps its baseline: " << e.what();
    }
}

} // namespace loom

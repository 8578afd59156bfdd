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

#include "durable_kv_store.h"
#include "kv_checkpoint.h"
#include "config.h"
#include "platform_fs.h"
#include "../core/error.h"
#include "../util/log.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <set>

namespace loom {
    namespace persist {

        DurableKvStore::DurableKvStore(const std::string& data_dir, const StorageConfig& config)
            : data_dir_(data_dir),
              config_(config),
              policy_(config.policy()),
              manifest_(data_dir),
              last_sync_(std::chrono::steady_clock::now()) {
            if (!config_.validate()) {
                throw ConfigError("invalid storage config for " + data_dir);
            }
        }

        DurableKvStore::~DurableKvStore() {
            close();
        }

        std::string DurableKvStore::log_file_name(uint64_t sequence) {
            char buf[64];
            snprintf(buf, sizeof(buf), "%s%020llu%s", files::kLogPrefix,
                     static_cast<unsigned long long>(sequence), files::kLogExtension);
            return buf;
        }

        void DurableKvStore::open() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (open_) return;

            FSResult dir = PlatformFS::ensure_directory(data_dir_);
            if (!dir.ok) {
                throw std::runtime_error("DurableKvStore: cannot create " + data_dir_ + ": " +
                                         errnoWithDescription(dir.err));
            }

            clear_unlocked();
            KvRecovery recovery(manifest_);
            recovery_stats_ = recovery.cold_start(
                [this](const std::string& key, const std::string& value) {
                    apply_unlocked(Transaction::Mutation{key, value, false});
                },
                [this](const Transaction::Mutation& m) { apply_unlocked(m); });
            commit_seq_ = recovery_stats_.last_commit_seq;

            if (manifest_.logs().empty()) {
                open_new_log_locked(1, commit_seq_ + 1);
                if (!manifest_.store()) {
                    throw std::runtime_error("DurableKvStore: cannot publish manifest in " + data_dir_);
                }
            } else {
                const auto& active = manifest_.logs().back();
                log_ = std::make_unique<KvLog>(
                    (std::filesystem::path(data_dir_) / active.path).string(), active.sequence);
                if (!log_->open_for_append()) {
                    throw std::runtime_error("DurableKvStore: cannot open log " + log_->path());
                }
            }

            open_ = true;
            info() << "DurableKvStore opened " << data_dir_ << " (" << durability_mode_name(policy_.mode)
                   << ", commit " << commit_seq_ << ")";
        }

        void DurableKvStore::close() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (!open_) return;
            if (log_) {
                log_->close();
                log_.reset();
            }
            open_ = false;
        }

        void DurableKvStore::open_new_log_locked(uint64_t sequence, uint64_t start_commit) {
            StoreManifest::LogInfo info;
            info.path = log_file_name(sequence);
            info.sequence = sequence;
            info.start_commit = start_commit;

            auto next = std::make_unique<KvLog>((std::filesystem::path(data_dir_) / info.path).string(), sequence);
            if (!next->open_for_append()) {
                throw std::runtime_error("DurableKvStore: cannot create log " + next->path());
            }
            manifest_.add_log(info);
            if (log_) log_->close();
            log_ = std::move(next);
        }

        void DurableKvStore::sync_log_locked() {
            log_->sync();
        }

        void DurableKvStore::on_commit_locked(const Transaction& txn) {
            if (!open_) {
                throw std::runtime_error("DurableKvStore: commit before open()");
            }
            if (failed_) {
                throw std::runtime_error("DurableKvStore: " + data_dir_ + " needs a reopen after a failed sync");
            }
            const uint64_t seq = commit_seq_ + 1;
            const uint64_t rollback = log_->end_offset();
            log_->append(seq, txn.mutations());

            try {
                switch (policy_.mode) {
                    case DurabilityMode::STRICT:
                        sync_log_locked();
                        break;
                    case DurabilityMode::BALANCED: {
                        auto now = std::chrono::steady_clock::now();
                        if (unsynced_ + 1 >= policy_.group_commit_count ||
                            now - last_sync_ >= std::chrono::milliseconds(policy_.group_commit_interval_ms)) {
                            sync_log_locked();
                            unsynced_ = 0;
                            last_sync_ = now;
                        } else {
                            ++unsynced_;
                        }
                        break;
                    }
                    case DurabilityMode::EVENTUAL:
                        break;
                }
            } catch (const std::runtime_error&) {
                // The caller sees a failed commit, so recovery must not replay it
                if (!log_->truncate_to(rollback)) {
                    failed_ = true;
                    error() << "DurableKvStore: unsynced frame " << seq << " stays in " << log_->path()
                            << ", refusing further commits";
                }
                throw;
            }
            commit_seq_ = seq;
            ++since_checkpoint_;
        }

        void DurableKvStore::commit(const Transaction& txn) {
            MemoryKvStore::commit(txn);

            std::unique_lock<std::shared_mutex> lock(mutex_);
            const bool by_count = since_checkpoint_ >= config_.checkpoint_every_commits;
            const bool by_size = log_ && log_->end_offset() >= config_.log_rotate_bytes;
            if (by_count || by_size) {
                if (!checkpoint_locked()) {
                    warning() << "DurableKvStore: checkpoint failed in " << data_dir_ << ", will retry";
                }
            }
        }

        void DurableKvStore::sync() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (log_) {
                sync_log_locked();
                unsynced_ = 0;
                last_sync_ = std::chrono::steady_clock::now();
            }
        }

        bool DurableKvStore::checkpoint() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return checkpoint_locked();
        }

        bool DurableKvStore::checkpoint_locked() {
            if (!open_ || failed_) return false;
            try {
                sync_log_locked();
            } catch (const std::runtime_error& e) {
                error() << "DurableKvStore: " << e.what();
                return false;
            }

            const std::string name = KvCheckpoint::file_name(commit_seq_);
            KvCheckpoint::Result r = KvCheckpoint::write(
                (std::filesystem::path(data_dir_) / name).string(), table_unlocked(), commit_seq_);
            if (!r.ok) {
                error() << "DurableKvStore: " << r.error;
                return false;
            }

            StoreManifest::CheckpointInfo info;
            info.path = name;
            info.commit_seq = r.commit_seq;
            info.entries = r.entries;
            info.crc32c = r.crc32c;

            // Publish the new checkpoint and log together; until the manifest
            // is stored the old log stays active so no commit is orphaned.
            StoreManifest::LogInfo next_info;
            next_info.sequence = log_->sequence() + 1;
            next_info.path = log_file_name(next_info.sequence);
            next_info.start_commit = commit_seq_ + 1;
            auto next = std::make_unique<KvLog>(
                (std::filesystem::path(data_dir_) / next_info.path).string(), next_info.sequence);
            if (!next->open_for_append()) {
                return false;
            }

            StoreManifest candidate = manifest_;
            candidate.set_checkpoint(info);
            candidate.add_log(next_info);
            candidate.prune_logs_before(commit_seq_);
            if (!candidate.store()) {
                next->close();
                if (!PlatformFS::remove(next->path()).ok) {
                    warning() << "DurableKvStore: could not remove unpublished log " << next->path();
                }
                return false;
            }

            manifest_ = candidate;
            log_->close();
            log_ = std::move(next);

            since_checkpoint_ = 0;
            unsynced_ = 0;
            remove_obsolete_files_locked();
            debug() << "DurableKvStore: checkpoint " << name << " (" << r.entries << " entries)";
            return true;
        }

        // Delete logs the manifest no longer names and checkpoints beyond the keep count.
        void DurableKvStore::remove_obsolete_files_locked() {
            std::set<std::string> live_logs;
            for (const auto& log : manifest_.logs()) live_logs.insert(log.path);

            std::vector<std::string> checkpoints;
            std::error_code ec;
            for (std::filesystem::directory_iterator it(data_dir_, ec), end; !ec && it != end; it.increment(ec)) {
                const std::string name = it->path().filename().string();
                const std::string ext = it->path().extension().string();
                if (ext == files::kLogExtension && !live_logs.count(name)) {
                    if (!PlatformFS::remove(it->path().string()).ok) {
                        warning() << "DurableKvStore: could not remove obsolete log " << name;
                    }
                } else if (ext == files::kCheckpointExtension) {
                    checkpoints.push_back(name);
                }
            }
            std::sort(checkpoints.begin(), checkpoints.end());
            while (checkpoints.size() > config_.checkpoint_keep_count) {
                if (checkpoints.front() != manifest_.checkpoint().path &&
                    !PlatformFS::remove((std::filesystem::path(data_dir_) / checkpoints.front()).string()).ok) {
                    warning() << "DurableKvStore: could not remove old checkpoint " << checkpoints.front();
                }
                checkpoints.erase(checkpoints.begin());
            }
        }

        uint64_t DurableKvStore::last_commit_seq() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return commit_seq_;
        }

    }
}

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
#include "memory_kv_store.h"
#include "kv_log.h"
#include "kv_recovery.h"
#include "store_manifest.h"
#include "storage_config.h"
#include <chrono>
#include <memory>

namespace loom {
    namespace persist {

        /**
         * DurableKvStore: MemoryKvStore whose commits are made durable in a
         * CRC-framed write-ahead log before they become visible.
         *
         * Every commit_count() commits (StorageConfig::checkpoint_every_commits)
         * the full table is checkpointed, the log rotated and the JSON manifest
         * republished. open() replays checkpoint + logs; it must be called
         * before any other operation.
         */
        class DurableKvStore : public MemoryKvStore {
        public:
            explicit DurableKvStore(const std::string& data_dir,
                                    const StorageConfig& config = StorageConfig::defaults());
            ~DurableKvStore() override;

            DurableKvStore(const DurableKvStore&) = delete;
            DurableKvStore& operator=(const DurableKvStore&) = delete;

            void open();
            void close();

            void commit(const Transaction& txn) override;
            void sync() override;

            // Write a checkpoint and rotate the log. Returns false on I/O failure.
            bool checkpoint();

            uint64_t last_commit_seq() const;
            const KvRecovery::Stats& recovery_stats() const { return recovery_stats_; }
            const std::string& data_dir() const { return data_dir_; }

        protected:
            void on_commit_locked(const Transaction& txn) override;

            // fdatasync of the active log; throws std::runtime_error on failure
            virtual void sync_log_locked();

        private:
            bool checkpoint_locked();
            void open_new_log_locked(uint64_t sequence, uint64_t start_commit);
            void remove_obsolete_files_locked();
            static std::string log_file_name(uint64_t sequence);

            std::string data_dir_;
            StorageConfig config_;
            DurabilityPolicy policy_;
            StoreManifest manifest_;
            std::unique_ptr<KvLog> log_;
            KvRecovery::Stats recovery_stats_;

            uint64_t commit_seq_ = 0;
            size_t unsynced_ = 0;
            size_t since_checkpoint_ = 0;
            std::chrono::steady_clock::time_point last_sync_;
            bool open_ = false;
            bool failed_ = false;   // log holds a frame that could not be dropped
        };

    }
}

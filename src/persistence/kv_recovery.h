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
#include <functional>
#include <string>
#include "store_manifest.h"
#include "kv_store.h"

namespace loom {
    namespace persist {

        /**
         * Cold-start recovery for a DurableKvStore directory:
         * manifest -> checkpoint -> write-ahead logs in sequence order.
         *
         * A torn or checksum-failing frame at the end of the newest log is
         * truncated away. The same failure in an older log, or an unreadable
         * checkpoint named by the manifest, throws CorruptError: those bytes
         * were acknowledged as durable and cannot be silently dropped.
         */
        class KvRecovery {
        public:
            struct Stats {
                bool manifest_loaded = false;
                size_t checkpoint_entries = 0;
                uint64_t checkpoint_commit = 0;
                size_t frames_replayed = 0;
                uint64_t truncated_bytes = 0;
                uint64_t last_commit_seq = 0;
                double elapsed_ms = 0;
            };

            using PutFn = std::function<void(const std::string& key, const std::string& value)>;
            using MutationFn = std::function<void(const Transaction::Mutation&)>;

            explicit KvRecovery(StoreManifest& mf) : mf_(mf) {}

            Stats cold_start(const PutFn& load_checkpoint_entry, const MutationFn& apply);

        private:
            StoreManifest& mf_;
        };

    } // namespace persist
} // namespace loom

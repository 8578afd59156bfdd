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
#include <vector>
#include <atomic>
#include <mutex>
#include "kv_store.h"

namespace loom {
    namespace persist {

        // Frame header: magic(4) | payload_len(4) | payload_crc(4) | header_crc(4)
        struct FrameHeader {
            uint32_t magic;
            uint32_t payload_size;
            uint32_t payload_crc;
            uint32_t header_crc;   // CRC32C of the first 12 bytes
        };

        /**
         * KvLog: append-only write-ahead log of committed KV transactions.
         *
         * One frame per commit. The payload carries the commit sequence and the
         * transaction's mutations in order, so replaying the frames in order
         * rebuilds the exact table. Appends are serialized by the owning store's
         * write lock; the log itself only guards open/close.
         */
        class KvLog {
        public:
            explicit KvLog(const std::string& path, uint64_t sequence = 0);
            ~KvLog();

            KvLog(const KvLog&) = delete;
            KvLog& operator=(const KvLog&) = delete;

            bool open_for_append();

            // Throws std::runtime_error on I/O failure; nothing is applied in that case
            void append(uint64_t commit_seq, const std::vector<Transaction::Mutation>& mutations);

            void sync();
            void close();

            // Drop everything past offset (an unsynced frame of a failed commit)
            bool truncate_to(uint64_t offset);

            using ApplyFn = std::function<void(uint64_t commit_seq,
                                               const std::vector<Transaction::Mutation>& mutations)>;

            /**
             * Replay every complete frame in path.
             *
             * Returns true when the file ends cleanly or with a torn (partially
             * written) frame; *last_good_offset is the end of the last complete
             * frame. Returns false with *error set on a checksum or format
             * failure; *last_good_offset is then the start of the bad frame.
             */
            static bool replay(const std::string& path, const ApplyFn& apply,
                               uint64_t* last_good_offset, std::string* error);

            static std::string encode_payload(uint64_t commit_seq,
                                              const std::vector<Transaction::Mutation>& mutations);

            uint64_t end_offset() const { return end_offset_.load(std::memory_order_acquire); }
            uint64_t sequence() const noexcept { return sequence_; }
            const std::string& path() const noexcept { return path_; }
            bool is_open() const { return fd_ >= 0; }

        private:
            std::string path_;
            int fd_ = -1;
            std::atomic<uint64_t> end_offset_{0};
            std::mutex open_close_mu_;
            uint64_t sequence_{0};
        };

    } // namespace persist
} // namespace loom

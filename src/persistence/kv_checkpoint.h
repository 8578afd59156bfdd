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
#include <map>
#include <string>

namespace loom {
    namespace persist {

        /**
         * KvCheckpoint: full image of a KV table at a commit sequence.
         *
         * Layout: magic(8) | version(4) | commit_seq(8) | entries(8) |
         *         { key | value }* | crc32c(4) over everything before it.
         * Written to <path>.tmp, synced, then atomically renamed.
         */
        class KvCheckpoint {
        public:
            struct Result {
                bool ok = false;
                uint64_t commit_seq = 0;
                size_t entries = 0;
                uint32_t crc32c = 0;
                std::string error;
            };

            static Result write(const std::string& path,
                                const std::map<std::string, std::string>& table,
                                uint64_t commit_seq);

            // Validates magic, version and checksum before calling apply for any entry
            static Result load(const std::string& path,
                               const std::function<void(const std::string&, const std::string&)>& apply);

            static std::string file_name(uint64_t commit_seq);
        };

    } // namespace persist
} // namespace loom

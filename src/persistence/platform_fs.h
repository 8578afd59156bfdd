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
#include <cstddef>
#include <string>
#include <utility>

namespace loom {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        /**
         * Thin POSIX file helpers used by the durable stores. Every call
         * reports failure through FSResult instead of throwing; callers
         * decide whether a failure is fatal.
         */
        class PlatformFS {
        public:
            static FSResult flush_file(int fd);
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(tmp, final) followed by an fsync of final's parent directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            // Write tmp, fdatasync it, then atomic_replace onto path
            static FSResult write_file_durable(const std::string& path, const std::string& contents);
            static FSResult read_file(const std::string& path, std::string* out);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
            static FSResult truncate(const std::string& path, size_t size);
            static FSResult remove(const std::string& path);
        };

    }
}

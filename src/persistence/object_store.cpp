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

#include "object_store.h"
#include "platform_fs.h"
#include "../core/error.h"
#include "../util/log.h"
#include <filesystem>
#include <mutex>

namespace loom {
    namespace persist {

        Hash MemoryObjectStore::put(const std::string& bytes) {
            Hash h = sha256(bytes);
            std::unique_lock<std::shared_mutex> lock(mutex_);
            blobs_.emplace(h, bytes);
            return h;
        }

        std::string MemoryObjectStore::get(const Hash& hash) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = blobs_.find(hash);
            if (it == blobs_.end()) {
                throw NotFoundError("object " + hash.hex());
            }
            return it->second;
        }

        bool MemoryObjectStore::contains(const Hash& hash) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return blobs_.count(hash) != 0;
        }

        bool MemoryObjectStore::remove(const Hash& hash) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return blobs_.erase(hash) != 0;
        }

        size_t MemoryObjectStore::size() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return blobs_.size();
        }

        FsObjectStore::FsObjectStore(const std::string& dir) : dir_(dir) {
            FSResult r = PlatformFS::ensure_directory(dir_);
            if (!r.ok) {
                throw std::runtime_error("FsObjectStore: cannot create " + dir_ + ": " + errnoWithDescription(r.err));
            }
        }

        std::string FsObjectStore::path_for(const Hash& hash) const {
            const std::string hex = hash.hex();
            return (std::filesystem::path(dir_) / hex.substr(0, 2) / hex).string();
        }

        Hash FsObjectStore::put(const std::string& bytes) {
            Hash h = sha256(bytes);
            const std::string path = path_for(h);
            if (PlatformFS::file_size(path).first.ok) {
                return h;  // immutable: same hash, same bytes
            }
            FSResult dir = PlatformFS::ensure_directory(std::filesystem::path(path).parent_path().string());
            if (!dir.ok) {
                throw std::runtime_error("FsObjectStore: mkdir failed for " + path + ": " + errnoWithDescription(dir.err));
            }
            FSResult r = PlatformFS::write_file_durable(path, bytes);
            if (!r.ok) {
                throw std::runtime_error("FsObjectStore: write failed for " + path + ": " + errnoWithDescription(r.err));
            }
            return h;
        }

        std::string FsObjectStore::get(const Hash& hash) const {
            std::string bytes;
            FSResult r = PlatformFS::read_file(path_for(hash), &bytes);
            if (!r.ok) {
                if (r.err == ENOENT) throw NotFoundError("object " + hash.hex());
                throw std::runtime_error("FsObjectStore: read failed for " + hash.hex() + ": " + errnoWithDescription(r.err));
            }
            if (sha256(bytes) != hash) {
                throw CorruptError("object " + hash.hex() + " content does not match its address");
            }
            return bytes;
        }

        bool FsObjectStore::contains(const Hash& hash) const {
            return PlatformFS::file_size(path_for(hash)).first.ok;
        }

    }
}

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
#include <map>
#include <shared_mutex>
#include <string>
#include "../core/hash.h"

namespace loom {
    namespace persist {

        /**
         * Content-addressed, immutable blob store. put() is idempotent and
         * returns sha256(bytes); get() of an unknown hash throws NotFoundError.
         */
        class ObjectStore {
        public:
            virtual ~ObjectStore() = default;

            virtual Hash put(const std::string& bytes) = 0;
            virtual std::string get(const Hash& hash) const = 0;
            virtual bool contains(const Hash& hash) const = 0;
        };

        class MemoryObjectStore final : public ObjectStore {
        public:
            Hash put(const std::string& bytes) override;
            std::string get(const Hash& hash) const override;
            bool contains(const Hash& hash) const override;

            // Drops a blob; only used to model lost objects
            bool remove(const Hash& hash);
            size_t size() const;

        private:
            mutable std::shared_mutex mutex_;
            std::map<Hash, std::string> blobs_;
        };

        /**
         * Blobs under <dir>/<first two hex digits>/<hex>, written with the
         * temp + rename pattern. Content is re-hashed on read; a mismatch
         * throws CorruptError.
         */
        class FsObjectStore final : public ObjectStore {
        public:
            explicit FsObjectStore(const std::string& dir);

            Hash put(const std::string& bytes) override;
            std::string get(const Hash& hash) const override;
            bool contains(const Hash& hash) const override;

            std::string path_for(const Hash& hash) const;

        private:
            std::string dir_;
        };

    }
}

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

#include "kv_checkpoint.h"
#include "checksums.h"
#include "config.h"
#include "platform_fs.h"
#include "../core/wire.h"
#include "../util/log.h"
#include <cstdio>

namespace loom {
    namespace persist {

        std::string KvCheckpoint::file_name(uint64_t commit_seq) {
            char buf[64];
            snprintf(buf, sizeof(buf), "%s%020llu%s", files::kLogPrefix,
                     static_cast<unsigned long long>(commit_seq), files::kCheckpointExtension);
            return buf;
        }

        KvCheckpoint::Result KvCheckpoint::write(const std::string& path,
                                                 const std::map<std::string, std::string>& table,
                                                 uint64_t commit_seq) {
            Result result;
            ByteWriter w;
            w.put_u64(checkpoint::kMagic);
            w.put_u32(checkpoint::kVersion);
            w.put_u64(commit_seq);
            w.put_u64(table.size());
            for (const auto& kv : table) {
                w.put_bytes(kv.first);
                w.put_bytes(kv.second);
            }
            const uint32_t crc = CRC32C::compute(w.str());
            w.put_u32(crc);

            FSResult r = PlatformFS::write_file_durable(path, w.str());
            if (!r.ok) {
                result.error = "checkpoint write failed: " + errnoWithDescription(r.err);
                return result;
            }

            result.ok = true;
            result.commit_seq = commit_seq;
            result.entries = table.size();
            result.crc32c = crc;
            return result;
        }

        KvCheckpoint::Result KvCheckpoint::load(
                const std::string& path,
                const std::function<void(const std::string&, const std::string&)>& apply) {
            Result result;
            std::string bytes;
            FSResult r = PlatformFS::read_file(path, &bytes);
            if (!r.ok) {
                result.error = "cannot read " + path + ": " + errnoWithDescription(r.err);
                return result;
            }
            if (bytes.size() < 4 + 28) {
                result.error = "checkpoint too short";
                return result;
            }

            const std::string body = bytes.substr(0, bytes.size() - 4);
            uint32_t stored_crc = 0;
            for (int i = 0; i < 4; ++i) {
                stored_crc |= static_cast<uint32_t>(static_cast<uint8_t>(bytes[body.size() + i])) << (8 * i);
            }
            if (CRC32C::compute(body) != stored_crc) {
                result.error = "checkpoint CRC mismatch";
                return result;
            }

            try {
                ByteReader rd(body, "checkpoint");
                if (rd.get_u64() != checkpoint::kMagic) {
                    result.error = "bad checkpoint magic";
                    return result;
                }
                if (rd.get_u32() != checkpoint::kVersion) {
                    result.error = "unsupported checkpoint version";
                    return result;
                }
                result.commit_seq = rd.get_u64();
                uint64_t n = rd.get_u64();
                for (uint64_t i = 0; i < n; ++i) {
                    std::string key = rd.get_bytes();
                    std::string value = rd.get_bytes();
                    apply(key, value);
                }
                rd.expect_done();
                result.entries = static_cast<size_t>(n);
            } catch (const std::exception& e) {
                result.error = e.what();
                return result;
            }

            result.ok = true;
            result.crc32c = stored_crc;
            return result;
        }

    } // namespace persist
} // namespace loom

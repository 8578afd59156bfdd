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

#include "kv_recovery.h"
#include "kv_checkpoint.h"
#include "kv_log.h"
#include "config.h"
#include "platform_fs.h"
#include "../core/error.h"
#include "../util/log.h"
#include <algorithm>
#include <chrono>
#include <filesystem>

namespace loom {
namespace persist {

KvRecovery::Stats KvRecovery::cold_start(const PutFn& load_checkpoint_entry, const MutationFn& apply) {
    auto start_time = std::chrono::steady_clock::now();
    Stats stats;
    const std::filesystem::path data_dir(mf_.data_dir());

    // Step 1: Load manifest (tolerate missing)
    stats.manifest_loaded = mf_.load();
    if (!stats.manifest_loaded) {
        debug() << "No manifest in " << data_dir << ", scanning for logs";
        std::error_code ec;
        std::vector<std::string> names;
        for (std::filesystem::directory_iterator it(data_dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file() && it->path().extension() == files::kLogExtension) {
                names.push_back(it->path().filename().string());
            }
        }
        std::sort(names.begin(), names.end());
        uint64_t seq = 0;
        for (const auto& name : names) {
            StoreManifest::LogInfo info;
            info.path = name;
            info.sequence = ++seq;
            mf_.add_log(info);
        }
    }

    // Step 2: Load checkpoint
    const auto& ckpt = mf_.checkpoint();
    if (!ckpt.path.empty()) {
        const std::string path = (data_dir / ckpt.path).string();
        KvCheckpoint::Result r = KvCheckpoint::load(path, load_checkpoint_entry);
        if (!r.ok) {
            throw CorruptError("checkpoint " + path + ": " + r.error);
        }
        if (r.crc32c != ckpt.crc32c) {
            throw CorruptError("checkpoint " + path + " does not match manifest checksum");
        }
        stats.checkpoint_entries = r.entries;
        stats.checkpoint_commit = r.commit_seq;
        stats.last_commit_seq = r.commit_seq;
        info() << "Loaded " << r.entries << " entries from checkpoint at commit " << r.commit_seq;
    }

    // Step 3: Replay logs in sequence order
    const auto& logs = mf_.logs();
    for (size_t i = 0; i < logs.size(); ++i) {
        const std::string path = (data_dir / logs[i].path).string();
        auto size = PlatformFS::file_size(path);
        if (!size.first.ok) {
            if (size.first.err == ENOENT) {
                // Logs are created before the manifest names them; a missing
                // file simply never received a commit.
                continue;
            }
            throw CorruptError("cannot stat log " + path + ": " + errnoWithDescription(size.first.err));
        }

        uint64_t last_good = 0;
        std::string err;
        bool ok = KvLog::replay(path,
            [&](uint64_t commit_seq, const std::vector<Transaction::Mutation>& mutations) {
                if (commit_seq <= stats.last_commit_seq) return;  // already in checkpoint
                for (const auto& m : mutations) apply(m);
                stats.last_commit_seq = commit_seq;
                ++stats.frames_replayed;
            },
            &last_good, &err);

        const bool newest = (i + 1 == logs.size());
        if (!ok && !newest) {
            throw CorruptError("log " + path + " damaged at offset " + std::to_string(last_good) + ": " + err);
        }
        if (last_good < size.second) {
            if (!newest) {
                throw CorruptError("log " + path + " has a torn frame before newer logs");
            }
            warning() << "Truncating " << (size.second - last_good) << " bytes of torn tail from " << path
                      << (ok ? std::string() : " (" + err + ")");
            FSResult t = PlatformFS::truncate(path, static_cast<size_t>(last_good));
            if (!t.ok) {
                throw CorruptError("cannot truncate " + path + ": " + errnoWithDescription(t.err));
            }
            stats.truncated_bytes += size.second - last_good;
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    stats.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    info() << "KV recovery complete: " << stats.frames_replayed << " frames replayed, last commit "
           << stats.last_commit_seq << " in " << stats.elapsed_ms << "ms";
    return stats;
}

} // namespace persist
} // namespace loom

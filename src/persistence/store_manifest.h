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
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace loom {
namespace persist {

/**
 * StoreManifest - JSON file naming the live files of a DurableKvStore
 *
 * Contains:
 * - Latest checkpoint info
 * - Write-ahead log inventory (in replay order)
 *
 * Written atomically via temp + rename pattern
 */
class StoreManifest {
public:
    struct CheckpointInfo {
        std::string path;        // relative to data_dir
        uint64_t commit_seq = 0; // last commit folded into the checkpoint
        size_t entries = 0;
        uint32_t crc32c = 0;
    };

    struct LogInfo {
        std::string path;        // relative to data_dir
        uint64_t sequence = 0;
        uint64_t start_commit = 0;
    };

    explicit StoreManifest(const std::string& data_dir);

    // Load manifest from disk (returns false if missing/corrupt)
    bool load();

    // Atomically persist (temp + rename + directory fsync)
    bool store();

    std::string to_json() const;
    bool from_json(const std::string& json_str);

    const CheckpointInfo& checkpoint() const { return checkpoint_; }
    void set_checkpoint(const CheckpointInfo& info) { checkpoint_ = info; }

    const std::vector<LogInfo>& logs() const { return logs_; }
    void add_log(const LogInfo& info) { logs_.push_back(info); }

    // Drop logs whose successors start at or before commit_seq + 1
    void prune_logs_before(uint64_t checkpoint_commit);

    const std::string& data_dir() const { return data_dir_; }
    std::string manifest_path() const;
    uint32_t version() const { return version_; }

private:
    std::string data_dir_;
    uint32_t version_ = 1;
    int64_t created_unix_ = 0;
    CheckpointInfo checkpoint_;
    std::vector<LogInfo> logs_;
};

} // namespace persist
} // namespace loom

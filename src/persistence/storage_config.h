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
#include <cstdlib>
#include <string>
#include "config.h"
#include "durability_policy.h"

namespace loom {
namespace persist {

/**
 * Runtime configuration for the storage layer
 */
struct StorageConfig {
    std::string data_dir;                                       // Empty = in-memory stores
    std::string durability = "balanced";
    size_t checkpoint_every_commits = checkpoint::kTriggerCommits;
    size_t checkpoint_keep_count = checkpoint::kKeepCount;
    size_t log_rotate_bytes = kv_log::kRotateSize;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StorageConfig defaults() {
        StorageConfig cfg;

        if (const char* env = std::getenv("LOOM_DATA_DIR")) {
            cfg.data_dir = env;
        }
        if (const char* env = std::getenv("LOOM_DURABILITY")) {
            cfg.durability = env;
        }
        if (const char* env = std::getenv("LOOM_CHECKPOINT_EVERY")) {
            cfg.checkpoint_every_commits = std::stoull(env);
        }
        if (const char* env = std::getenv("LOOM_CHECKPOINT_KEEP_COUNT")) {
            cfg.checkpoint_keep_count = std::stoull(env);
        }

        return cfg;
    }

    DurabilityPolicy policy() const { return get_durability_policy(durability); }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (durability != "strict" && durability != "balanced" && durability != "eventual") {
            return false;
        }
        if (checkpoint_every_commits < 1) {
            return false;
        }
        if (checkpoint_keep_count < 1) {
            // Must keep at least one checkpoint
            return false;
        }
        return true;
    }
};

} // namespace persist
} // namespace loom

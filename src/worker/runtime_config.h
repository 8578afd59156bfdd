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
#include <string>
#include "../persistence/config.h"
#include "../persistence/storage_config.h"

namespace loom {

/**
 * Node-wide runtime settings. defaults() reads LOOM_* environment
 * overrides; from_json() layers a JSON file on top of defaults().
 */
struct RuntimeConfig {
    std::string worker_id;
    uint64_t lease_ttl_ms = persist::lease::kDefaultTtlMs;
    uint64_t claim_ttl_ms = persist::delivery::kDefaultClaimTtlMs;
    size_t step_budget = persist::worker::kDefaultStepBudget;
    size_t inbox_batch = persist::worker::kDefaultInboxBatch;
    uint64_t snapshot_every = persist::worker::kDefaultSnapshotEvery;
    size_t delivery_batch = persist::delivery::kDefaultBatch;
    uint32_t max_claims = persist::delivery::kDefaultMaxAttempts;
    uint32_t adapter_attempts = 3;
    uint64_t adapter_backoff_ms = 50;
    uint64_t poll_interval_ms = persist::worker::kDefaultPollIntervalMs;
    persist::StorageConfig storage;

    static RuntimeConfig defaults();

    // Throws ConfigError on unreadable or malformed files
    static RuntimeConfig from_json(const std::string& path);
    void apply_json(const std::string& json);

    // Empty when valid, otherwise the first problem found
    std::string validate() const;
};

} // namespace loom

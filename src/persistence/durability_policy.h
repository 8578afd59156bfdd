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
#include <chrono>
#include <cstddef>
#include <string>

namespace loom {
namespace persist {

enum class DurabilityMode {
    STRICT,    // fdatasync after every commit
    BALANCED,  // group commit: sync every N commits or interval (default)
    EVENTUAL   // page cache only; sync on checkpoint and close
};

struct DurabilityPolicy {
    DurabilityMode mode = DurabilityMode::BALANCED;

    // BALANCED mode settings
    size_t group_commit_count = 32;
    size_t group_commit_interval_ms = 5;

    bool validate_checksums_on_recovery = true;
};

inline DurabilityPolicy get_durability_policy(const std::string& name) {
    DurabilityPolicy policy;

    if (name == "strict") {
        policy.mode = DurabilityMode::STRICT;
        policy.group_commit_interval_ms = 0;
    } else if (name == "eventual") {
        policy.mode = DurabilityMode::EVENTUAL;
    }

    return policy;
}

inline const char* durability_mode_name(DurabilityMode mode) {
    switch (mode) {
        case DurabilityMode::STRICT: return "strict";
        case DurabilityMode::BALANCED: return "balanced";
        case DurabilityMode::EVENTUAL: return "eventual";
    }
    return "unknown";
}

} // namespace persist
} // namespace loom

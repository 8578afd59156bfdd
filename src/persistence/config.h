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

namespace loom {
namespace persist {

// Key/value write-ahead log
namespace kv_log {
    constexpr uint32_t kFrameMagic = 0x4C4F4F4D;                // "LOOM"
    constexpr uint32_t kVersion = 1;
    constexpr size_t kFrameHeaderSize = 16;                    // magic, version, length, crc
    constexpr size_t kMaxFrameSize = 64 * 1024 * 1024;        // Reject absurd lengths on recovery
    constexpr size_t kRotateSize = 64 * 1024 * 1024;          // Checkpoint + rotate at 64MB
    constexpr uint8_t kOpPut = 1;
    constexpr uint8_t kOpErase = 2;
}

// Key/value checkpoints
namespace checkpoint {
    constexpr uint64_t kMagic = 0x4C4F4F4D434B5031ULL;         // "LOOMCKP1"
    constexpr uint32_t kVersion = 1;
    constexpr size_t kTriggerCommits = 4096;                   // Checkpoint after N commits
    constexpr size_t kKeepCount = 2;
}

// Journal layout
namespace journal {
    constexpr uint64_t kSegmentSpan = 4096;                    // Heights per journal segment
    constexpr int kHeightDigits = 20;                          // Zero padded so keys sort numerically
    constexpr int kSegmentDigits = 10;
}

// Leases and claims
namespace lease {
    constexpr uint64_t kDefaultTtlMs = 10000;
}

namespace delivery {
    constexpr uint64_t kDefaultClaimTtlMs = 30000;
    constexpr size_t kDefaultBatch = 64;
    constexpr uint32_t kDefaultMaxAttempts = 5;
    constexpr int kAckRetries = 8;                             // CommitConflict retries on ack
}

namespace worker {
    constexpr size_t kDefaultStepBudget = 256;                 // Records folded per cycle
    constexpr size_t kDefaultInboxBatch = 64;
    constexpr uint64_t kDefaultSnapshotEvery = 128;            // Records between snapshots
    constexpr uint64_t kDefaultPollIntervalMs = 20;
}

// File naming configuration
namespace files {
    constexpr const char* kLogPrefix = "kv-";
    constexpr const char* kLogExtension = ".wal";
    constexpr const char* kCheckpointExtension = ".ckpt";
    constexpr const char* kManifestFile = "MANIFEST";
    constexpr const char* kKvDir = "kv";
    constexpr const char* kObjectsDir = "objects";
}

} // namespace persist
} // namespace loom

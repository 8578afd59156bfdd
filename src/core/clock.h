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
#include <cstdint>

namespace loom {

/**
 * Wall-clock source for leases, claim TTLs and ingress stamping. The
 * kernel never reads a clock; logical time reaches it only through
 * journaled records.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_ns() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now_ns() const override {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
};

inline uint64_t to_ns(std::chrono::milliseconds ms) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(ms).count());
}

} // namespace loom

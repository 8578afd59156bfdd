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
#include <string>
#include <mutex>

namespace loom {
namespace persist {

// CRC32C (Castagnoli). Frames every record the durable stores write.
class CRC32C {
public:
    using value_type = uint32_t;

    CRC32C() : value_(~0u) {}

    void update(const void* data, size_t len);
    void update(const std::string& data) { update(data.data(), data.size()); }

    uint32_t finalize() const { return value_ ^ 0xFFFFFFFF; }
    void reset() { value_ = ~0u; }

    static uint32_t compute(const void* data, size_t len);
    static uint32_t compute(const std::string& data) { return compute(data.data(), data.size()); }

    static uint32_t software_crc32c(uint32_t crc, const uint8_t* data, size_t len);

#if defined(__x86_64__)
    static bool has_sse42();
    static uint32_t hardware_crc32c(uint32_t crc, const uint8_t* data, size_t len);
#endif

private:
    uint32_t value_;

    static constexpr uint32_t kPolynomial = 0x82F63B78;

    static uint32_t table_[256];
    static std::once_flag init_once_;
    static void init_table();
};

} // namespace persist
} // namespace loom

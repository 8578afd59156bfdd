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

#include "checksums.h"
#include <cstring>

#if defined(__x86_64__)
#include <immintrin.h>
#include <cpuid.h>
#endif

namespace loom {
namespace persist {

uint32_t CRC32C::table_[256];
std::once_flag CRC32C::init_once_;

void CRC32C::init_table() {
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t r = i;
        for (int k = 0; k < 8; ++k) {
            r = (r >> 1) ^ (-(int32_t)(r & 1) & kPolynomial);
        }
        table_[i] = r;
    }
}

void CRC32C::update(const void* data, size_t len) {
    if (len == 0 || data == nullptr) return;
    const uint8_t* p = static_cast<const uint8_t*>(data);

#if defined(__x86_64__)
    static const bool hw = has_sse42();
    if (hw) {
        value_ = hardware_crc32c(value_, p, len);
        return;
    }
#endif
    value_ = software_crc32c(value_, p, len);
}

uint32_t CRC32C::compute(const void* data, size_t len) {
    CRC32C crc;
    crc.update(data, len);
    return crc.finalize();
}

uint32_t CRC32C::software_crc32c(uint32_t crc, const uint8_t* data, size_t len) {
    std::call_once(init_once_, &CRC32C::init_table);
    for (size_t i = 0; i < len; i++) {
        crc = (crc >> 8) ^ table_[(crc ^ data[i]) & 0xFF];
    }
    return crc;
}

#if defined(__x86_64__)
bool CRC32C::has_sse42() {
    unsigned int eax, ebx, ecx, edx;
    if (!__get_cpuid(1, &eax, &ebx, &ecx, &edx)) return false;
    return (ecx & bit_SSE4_2) != 0;
}

__attribute__((target("sse4.2")))
uint32_t CRC32C::hardware_crc32c(uint32_t crc, const uint8_t* data, size_t len) {
    uint64_t c = crc;
    while (len >= 8) {
        uint64_t v;
        memcpy(&v, data, 8);
        c = _mm_crc32_u64(c, v);
        data += 8;
        len -= 8;
    }
    uint32_t c32 = static_cast<uint32_t>(c);
    while (len--) {
        c32 = _mm_crc32_u8(c32, *data++);
    }
    return c32;
}
#endif

} // namespace persist
} // namespace loom

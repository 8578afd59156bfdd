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

#include <array>
#include <cstdint>
#include <string>

namespace loom {

/**
 * SHA-256 content address. Used for object store keys, intent hashes,
 * snapshot references and state hashes.
 */
struct Hash {
    static constexpr size_t kSize = 32;
    std::array<uint8_t, kSize> bytes{};

    bool is_zero() const;
    std::string hex() const;
    std::string short_hex() const { return hex().substr(0, 12); }

    // Raw 32-byte form, as embedded in canonical encodings
    std::string raw() const { return std::string(reinterpret_cast<const char*>(bytes.data()), kSize); }

    static Hash from_raw(const std::string& raw);
    // Throws CorruptError on malformed input
    static Hash from_hex(const std::string& hex);

    bool operator==(const Hash& o) const { return bytes == o.bytes; }
    bool operator!=(const Hash& o) const { return bytes != o.bytes; }
    bool operator<(const Hash& o) const { return bytes < o.bytes; }
};

Hash sha256(const std::string& data);
Hash sha256(const void* data, size_t len);

} // namespace loom

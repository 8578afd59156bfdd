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

#include "hash.h"
#include "error.h"
#include <algorithm>
#include <openssl/sha.h>

namespace loom {

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

bool Hash::is_zero() const {
    for (uint8_t b : bytes) {
        if (b) return false;
    }
    return true;
}

std::string Hash::hex() const {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(kSize * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

Hash Hash::from_raw(const std::string& raw) {
    if (raw.size() != kSize) {
        throw CorruptError("hash: expected 32 raw bytes, got " + std::to_string(raw.size()));
    }
    Hash h;
    std::copy(raw.begin(), raw.end(), h.bytes.begin());
    return h;
}

Hash Hash::from_hex(const std::string& hex) {
    if (hex.size() != kSize * 2) {
        throw CorruptError("hash: bad hex length " + std::to_string(hex.size()));
    }
    Hash h;
    for (size_t i = 0; i < kSize; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) throw CorruptError("hash: bad hex digit in " + hex);
        h.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return h;
}

Hash sha256(const void* data, size_t len) {
    Hash h;
    SHA256(static_cast<const unsigned char*>(data), len, h.bytes.data());
    return h;
}

Hash sha256(const std::string& data) {
    return sha256(data.data(), data.size());
}

} // namespace loom

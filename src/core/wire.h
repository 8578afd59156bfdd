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
#include <cstring>
#include <string>
#include "error.h"

namespace loom {

/**
 * Canonical binary encoding used for every hashed or persisted value.
 *
 * Integers are fixed-width little-endian; byte strings are a u32 length
 * followed by the raw bytes. There is exactly one encoding per value, so
 * equal values always hash equal.
 */
class ByteWriter {
public:
    ByteWriter() = default;

    void put_u8(uint8_t v) { buf_.push_back(static_cast<char>(v)); }

    void put_u32(uint32_t v) {
        char b[4];
        for (int i = 0; i < 4; ++i) b[i] = static_cast<char>(v >> (8 * i));
        buf_.append(b, 4);
    }

    void put_u64(uint64_t v) {
        char b[8];
        for (int i = 0; i < 8; ++i) b[i] = static_cast<char>(v >> (8 * i));
        buf_.append(b, 8);
    }

    void put_bool(bool v) { put_u8(v ? 1 : 0); }

    void put_bytes(const std::string& s) {
        put_u32(static_cast<uint32_t>(s.size()));
        buf_.append(s);
    }

    void put_raw(const void* data, size_t len) {
        buf_.append(static_cast<const char*>(data), len);
    }

    const std::string& str() const { return buf_; }
    std::string take() { return std::move(buf_); }
    size_t size() const { return buf_.size(); }

private:
    std::string buf_;
};

/**
 * Reader over a canonical encoding. Any read past the end throws
 * CorruptError; decoders never see a partially filled value.
 */
class ByteReader {
public:
    explicit ByteReader(const std::string& data, const char* what = "record")
        : data_(data), pos_(0), what_(what) {}

    uint8_t get_u8() {
        need(1);
        return static_cast<uint8_t>(data_[pos_++]);
    }

    uint32_t get_u32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
            v |= static_cast<uint32_t>(static_cast<uint8_t>(data_[pos_ + i])) << (8 * i);
        pos_ += 4;
        return v;
    }

    uint64_t get_u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
            v |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_ + i])) << (8 * i);
        pos_ += 8;
        return v;
    }

    bool get_bool() {
        uint8_t v = get_u8();
        if (v > 1) throw CorruptError(std::string(what_) + ": invalid bool");
        return v == 1;
    }

    std::string get_bytes() {
        uint32_t len = get_u32();
        need(len);
        std::string out = data_.substr(pos_, len);
        pos_ += len;
        return out;
    }

    void get_raw(void* out, size_t len) {
        need(len);
        std::memcpy(out, data_.data() + pos_, len);
        pos_ += len;
    }

    bool done() const { return pos_ == data_.size(); }
    size_t remaining() const { return data_.size() - pos_; }

    // Decoders call this last; trailing garbage is corruption too.
    void expect_done() const {
        if (!done())
            throw CorruptError(std::string(what_) + ": " + std::to_string(remaining()) + " trailing bytes");
    }

private:
    void need(size_t n) const {
        if (data_.size() - pos_ < n)
            throw CorruptError(std::string(what_) + ": truncated at offset " + std::to_string(pos_));
    }

    std::string data_;
    size_t pos_;
    const char* what_;
};

} // namespace loom

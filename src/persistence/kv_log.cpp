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

#include "kv_log.h"
#include "checksums.h"
#include "config.h"
#include "platform_fs.h"
#include "../core/wire.h"
#include "../util/log.h"
#include <fstream>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

namespace loom {
    namespace persist {

        namespace {
            void store_le32(char* buf, uint32_t v) {
                for (int i = 0; i < 4; ++i) buf[i] = static_cast<char>(v >> (8 * i));
            }

            uint32_t load_le32(const char* buf) {
                uint32_t v = 0;
                for (int i = 0; i < 4; ++i)
                    v |= static_cast<uint32_t>(static_cast<uint8_t>(buf[i])) << (8 * i);
                return v;
            }

            bool pwrite_all(int fd, const void* buf, size_t len, off_t offset) {
                const uint8_t* p = static_cast<const uint8_t*>(buf);
                size_t remaining = len;

                while (remaining > 0) {
                    ssize_t written = ::pwrite(fd, p, remaining, offset);
                    if (written < 0) {
                        if (errno == EINTR) {
                            continue;  // Retry on interrupt
                        }
                        return false;
                    }
                    p += written;
                    offset += written;
                    remaining -= written;
                }
                return true;
            }
        } // namespace

        KvLog::KvLog(const std::string& path, uint64_t sequence)
            : path_(path), sequence_(sequence) {}

        KvLog::~KvLog() {
            close();
        }

        bool KvLog::open_for_append() {
            std::lock_guard<std::mutex> lock(open_close_mu_);
            if (fd_ >= 0) return true;

            fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                error() << "KvLog: cannot open " << path_ << ": " << errnoWithDescription();
                return false;
            }
            off_t end = ::lseek(fd_, 0, SEEK_END);
            if (end < 0) {
                error() << "KvLog: lseek failed on " << path_ << ": " << errnoWithDescription();
                ::close(fd_);
                fd_ = -1;
                return false;
            }
            end_offset_.store(static_cast<uint64_t>(end), std::memory_order_release);
            return true;
        }

        std::string KvLog::encode_payload(uint64_t commit_seq,
                                          const std::vector<Transaction::Mutation>& mutations) {
            ByteWriter w;
            w.put_u64(commit_seq);
            w.put_u32(static_cast<uint32_t>(mutations.size()));
            for (const auto& m : mutations) {
                w.put_u8(m.erase ? kv_log::kOpErase : kv_log::kOpPut);
                w.put_bytes(m.key);
                if (!m.erase) w.put_bytes(m.value);
            }
            return w.take();
        }

        void KvLog::append(uint64_t commit_seq, const std::vector<Transaction::Mutation>& mutations) {
            if (fd_ < 0) {
                throw std::runtime_error("KvLog: append on closed log " + path_);
            }
            const std::string payload = encode_payload(commit_seq, mutations);

            std::string frame(kv_log::kFrameHeaderSize, '\0');
            store_le32(&frame[0], kv_log::kFrameMagic);
            store_le32(&frame[4], static_cast<uint32_t>(payload.size()));
            store_le32(&frame[8], CRC32C::compute(payload));
            store_le32(&frame[12], CRC32C::compute(frame.data(), 12));
            frame += payload;

            uint64_t offset = end_offset_.load(std::memory_order_acquire);
            if (!pwrite_all(fd_, frame.data(), frame.size(), static_cast<off_t>(offset))) {
                throw std::runtime_error("KvLog: write failed on " + path_ + ": " + errnoWithDescription());
            }
            end_offset_.store(offset + frame.size(), std::memory_order_release);
        }

        void KvLog::sync() {
            if (fd_ < 0) return;
            FSResult r = PlatformFS::flush_file(fd_);
            if (!r.ok) {
                throw std::runtime_error("KvLog: fdatasync failed on " + path_ + ": " + errnoWithDescription(r.err));
            }
        }

        bool KvLog::truncate_to(uint64_t offset) {
            if (fd_ < 0) return false;
            if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0) {
                error() << "KvLog: ftruncate failed on " << path_ << ": " << errnoWithDescription();
                return false;
            }
            end_offset_.store(offset, std::memory_order_release);
            return true;
        }

        void KvLog::close() {
            std::lock_guard<std::mutex> lock(open_close_mu_);
            if (fd_ < 0) return;
            if (!PlatformFS::flush_file(fd_).ok) {
                warning() << "KvLog: final sync failed on " << path_;
            }
            ::close(fd_);
            fd_ = -1;
        }

        bool KvLog::replay(const std::string& path, const ApplyFn& apply,
                           uint64_t* last_good_offset, std::string* error) {
            *last_good_offset = 0;

            std::ifstream file(path, std::ios::binary);
            if (!file) {
                if (error) *error = "Failed to open log file";
                return false;
            }

            char header_buf[kv_log::kFrameHeaderSize];
            std::string payload;

            while (file.good()) {
                uint64_t frame_start = static_cast<uint64_t>(file.tellg());

                file.read(header_buf, kv_log::kFrameHeaderSize);
                if (file.gcount() == 0) {
                    // Clean EOF
                    *last_good_offset = frame_start;
                    break;
                }
                if (file.gcount() < static_cast<std::streamsize>(kv_log::kFrameHeaderSize)) {
                    // Partial header at end - torn tail
                    *last_good_offset = frame_start;
                    return true;
                }

                FrameHeader header;
                header.magic = load_le32(header_buf);
                header.payload_size = load_le32(header_buf + 4);
                header.payload_crc = load_le32(header_buf + 8);
                header.header_crc = load_le32(header_buf + 12);

                if (CRC32C::compute(header_buf, 12) != header.header_crc ||
                    header.magic != kv_log::kFrameMagic) {
                    if (error) *error = "Header CRC mismatch";
                    *last_good_offset = frame_start;
                    return false;
                }
                if (header.payload_size > kv_log::kMaxFrameSize) {
                    if (error) *error = "Frame length out of range";
                    *last_good_offset = frame_start;
                    return false;
                }

                payload.resize(header.payload_size);
                file.read(&payload[0], header.payload_size);
                if (file.gcount() < static_cast<std::streamsize>(header.payload_size)) {
                    // Incomplete payload at end - torn tail
                    *last_good_offset = frame_start;
                    return true;
                }
                if (CRC32C::compute(payload) != header.payload_crc) {
                    if (error) *error = "Payload CRC mismatch";
                    *last_good_offset = frame_start;
                    return false;
                }

                std::vector<Transaction::Mutation> mutations;
                uint64_t commit_seq = 0;
                try {
                    ByteReader r(payload, "kv frame");
                    commit_seq = r.get_u64();
                    uint32_t n = r.get_u32();
                    mutations.reserve(n);
                    for (uint32_t i = 0; i < n; ++i) {
                        Transaction::Mutation m;
                        uint8_t op = r.get_u8();
                        m.key = r.get_bytes();
                        m.erase = (op == kv_log::kOpErase);
                        if (!m.erase) m.value = r.get_bytes();
                        mutations.push_back(std::move(m));
                    }
                    r.expect_done();
                } catch (const std::exception& e) {
                    if (error) *error = e.what();
                    *last_good_offset = frame_start;
                    return false;
                }

                apply(commit_seq, mutations);
                *last_good_offset = static_cast<uint64_t>(file.tellg());
            }

            return true;
        }

    } // namespace persist
} // namespace loom

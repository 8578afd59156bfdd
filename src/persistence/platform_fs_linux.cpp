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

#include "platform_fs.h"

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <filesystem>
#include <cstring>

namespace loom {
    namespace persist {

        FSResult PlatformFS::flush_file(int fd) {
            int rc = ::fdatasync(fd);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            // Fsync the directory to ensure metadata changes are persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        FSResult PlatformFS::write_file_durable(const std::string& path, const std::string& contents) {
            const std::string tmp = path + ".tmp";
            int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            const char* p = contents.data();
            size_t left = contents.size();
            while (left > 0) {
                ssize_t n = ::write(fd, p, left);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    ::unlink(tmp.c_str());
                    return {false, ec};
                }
                p += n;
                left -= static_cast<size_t>(n);
            }

            FSResult synced = flush_file(fd);
            ::close(fd);
            if (!synced.ok) {
                ::unlink(tmp.c_str());
                return synced;
            }
            return atomic_replace(tmp, path);
        }

        FSResult PlatformFS::read_file(const std::string& path, std::string* out) {
            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }
            out->clear();
            char buf[64 * 1024];
            for (;;) {
                ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    return {false, ec};
                }
                if (n == 0) break;
                out->append(buf, static_cast<size_t>(n));
            }
            ::close(fd);
            return {true, 0};
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec && !std::filesystem::is_directory(path)) {
                return {false, ec.value()};
            }
            return {true, 0};
        }

        FSResult PlatformFS::truncate(const std::string& path, size_t size) {
            if (::truncate(path.c_str(), off_t(size)) == 0) {
                return {true, 0};
            }
            return {false, errno};
        }

        FSResult PlatformFS::remove(const std::string& path) {
            if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
                return {true, 0};
            }
            return {false, errno};
        }

    } // namespace persist
} // namespace loom

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

#include "log.h"
#include <chrono>
#include <boost/filesystem.hpp>

namespace loom {

    /**
     * Owns the process log file. All native output is redirected to
     * <log_dir>/loom.log; the file is rotated to a timestamped name when it
     * grows past RotationConfig::max_file_size, and rotated files beyond
     * max_files or older than max_age are pruned.
     */
    class LogManager {
    public:
        struct RotationConfig {
            size_t max_file_size;
            size_t max_files;
            std::chrono::hours max_age;
            bool enable_auto_rotation;

            RotationConfig()
                : max_file_size(64ull * 1024 * 1024)
                , max_files(8)
                , max_age(std::chrono::hours(24 * 7))
                , enable_auto_rotation(true) {}
        };

        LogManager(const std::string& log_dir, const RotationConfig& rotation = RotationConfig())
            : _rotation(rotation), _file(nullptr), _written(0) {
            boost::filesystem::path dir(log_dir.empty() ? default_log_dir() : log_dir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("LogManager: cannot create log dir " + dir.string() +
                                         ": " + ec.message());
            }
            _path = (dir / "loom.log").string();
            start(true);
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
                _file = nullptr;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        /**
         * Rotate if the active file has grown past the configured size.
         * Returns true if a rotation happened.
         */
        bool maybe_rotate() {
            if (!_rotation.enable_auto_rotation || !_file) return false;
            long size = ftell(_file);
            if (size < 0 || static_cast<size_t>(size) < _rotation.max_file_size) return false;
            rotate();
            return true;
        }

        void rotate() {
            if ( _file ) {
#ifdef POSIX_FADV_DONTNEED
                posix_fadvise(fileno(_file), 0, 0, POSIX_FADV_DONTNEED);
#endif
                // Rename the (open) existing log file to a timestamped name
                std::stringstream ss;
                ss << _path << "." << terseCurrentTime() << "." << (++_written);
                if (rename( _path.c_str() , ss.str().c_str() ) != 0) {
                    std::cerr << "LogManager: rename failed: " << errnoWithDescription() << std::endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), "a");
            if ( !tmp ) {
                throw std::runtime_error("LogManager: can't open " + _path + ": " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file
            if ( _file )
                fclose( _file );
            _file = tmp;
            prune();
        }

        static std::string default_log_dir() {
            if (const char* dir = std::getenv("LOOM_LOG_DIR")) return dir;
            return (boost::filesystem::temp_directory_path() / "loom-logs").string();
        }

    private:
        void start(bool append) {
            bool exists = boost::filesystem::exists(_path);
            _file = fopen(_path.c_str(), append ? "a" : "w");
            if ( ! _file ) {
                throw std::runtime_error("LogManager: can't open [" + _path + "] for log file: " +
                                         errnoWithDescription());
            }
            if (append && exists) {
                const std::string msg = "\n\n***** RUNTIME RESTARTED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), _file) != msg.size()) {
                    std::cerr << "LogManager: failed to write restart banner" << std::endl;
                }
            }
            Logger::setLogFile(_file);
        }

        static std::string terseCurrentTime() {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &t);
            return buf;
        }

        // Remove rotated files past the retention limits, oldest first.
        void prune() {
            namespace fs = boost::filesystem;
            fs::path active(_path);
            std::vector<std::pair<std::time_t, fs::path>> rotated;
            boost::system::error_code ec;
            for (fs::directory_iterator it(active.parent_path(), ec), end; !ec && it != end; it.increment(ec)) {
                const std::string name = it->path().filename().string();
                if (name.size() > active.filename().string().size() &&
                    name.compare(0, active.filename().string().size() + 1, active.filename().string() + ".") == 0) {
                    rotated.emplace_back(fs::last_write_time(it->path(), ec), it->path());
                }
            }
            std::sort(rotated.begin(), rotated.end());
            const std::time_t cutoff = time(0) -
                std::chrono::duration_cast<std::chrono::seconds>(_rotation.max_age).count();
            size_t remaining = rotated.size();
            for (const auto& entry : rotated) {
                if (remaining > _rotation.max_files || entry.first < cutoff) {
                    fs::remove(entry.second, ec);
                    --remaining;
                }
            }
        }

        RotationConfig _rotation;
        std::string _path;
        FILE* _file;
        uint64_t _written;
    };
}

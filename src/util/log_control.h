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
#include <csignal>
#include <fstream>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <filesystem>

namespace loom {

/**
 * Runtime log level control for long-running nodes.
 *
 * Supports:
 * 1. Signal-based control (SIGUSR1/SIGUSR2/SIGHUP)
 * 2. File-based control (/tmp/loom_log_level)
 * 3. Programmatic control
 */
class LogControl {
private:
    static std::atomic<int> pending_action;  // Signal action to apply

public:
    // Async-signal-safe handlers that only set an atomic flag
    static void increaseLogLevel(int) {
        pending_action.store(1, std::memory_order_relaxed);
    }

    static void decreaseLogLevel(int) {
        pending_action.store(-1, std::memory_order_relaxed);
    }

    static void reloadLogLevel(int) {
        pending_action.store(2, std::memory_order_relaxed);
    }

    // Process pending signal actions (called from safe context)
    static void processPendingActions() {
        int action = pending_action.exchange(0, std::memory_order_relaxed);
        if (action == 1) {
            int current = logLevel.load(std::memory_order_relaxed);
            if (current > LOG_TRACE) {
                logLevel.store(current - 1, std::memory_order_relaxed);
                logMessage();
            }
        } else if (action == -1) {
            int current = logLevel.load(std::memory_order_relaxed);
            if (current < LOG_SEVERE) {
                logLevel.store(current + 1, std::memory_order_relaxed);
                logMessage();
            }
        } else if (action == 2) {
            initLoggingFromEnv();
            logMessage();
        }
    }

    static void installSignalHandlers() {
        std::signal(SIGUSR1, increaseLogLevel);
        std::signal(SIGUSR2, decreaseLogLevel);
        std::signal(SIGHUP, reloadLogLevel);
        info() << "Log control signals installed: "
               << "SIGUSR1=increase verbosity, "
               << "SIGUSR2=decrease verbosity, "
               << "SIGHUP=reload from LOG_LEVEL env";
    }

    static std::atomic<bool> file_watcher_running;
    static std::thread* file_watcher_thread;
    static std::mutex file_watcher_mutex;

    static void startFileWatcher(const std::string& path = "/tmp/loom_log_level") {
        std::lock_guard<std::mutex> lock(file_watcher_mutex);

        if (file_watcher_running.load()) {
            return;
        }

        file_watcher_running.store(true);
        file_watcher_thread = new std::thread([path]() {
            info() << "Log level file watcher started: " << path;

            std::filesystem::path control_file(path);
            auto last_write = std::filesystem::file_time_type::min();

            while (file_watcher_running.load()) {
                std::error_code ec;
                if (std::filesystem::exists(control_file, ec)) {
                    auto current_write = std::filesystem::last_write_time(control_file, ec);
                    if (!ec && current_write != last_write) {
                        last_write = current_write;

                        std::ifstream file(path);
                        std::string level;
                        if (std::getline(file, level) && setLogLevelFromString(level)) {
                            info() << "Log level changed to " << level << " from file";
                        }
                    }
                }

                for (int i = 0; i < 10 && file_watcher_running.load(); ++i) {
                    processPendingActions();
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            }
        });
    }

    static void stopFileWatcher() {
        std::lock_guard<std::mutex> lock(file_watcher_mutex);

        if (!file_watcher_running.load()) {
            return;
        }

        file_watcher_running.store(false);

        if (file_watcher_thread && file_watcher_thread->joinable()) {
            file_watcher_thread->join();
            delete file_watcher_thread;
            file_watcher_thread = nullptr;
        }
    }

    static void setLogLevel(LogLevel level) {
        logLevel.store(level, std::memory_order_relaxed);
        logMessage();
    }

    static std::string getCurrentLogLevelString() {
        return logLevelToString(static_cast<LogLevel>(logLevel.load(std::memory_order_relaxed)));
    }

private:
    static void logMessage() {
        // Use cerr directly to ensure this message is always visible
        std::cerr << "[LogControl] Log level is now: "
                  << getCurrentLogLevelString()
                  << " (" << logLevel.load() << ")" << std::endl;
    }
};

inline std::atomic<bool> LogControl::file_watcher_running{false};
inline std::thread* LogControl::file_watcher_thread = nullptr;
inline std::mutex LogControl::file_watcher_mutex;
inline std::atomic<int> LogControl::pending_action{0};

} // namespace loom

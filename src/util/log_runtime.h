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
#include "logmanager.h"
#include "log_control.h"
#include <memory>
#include <mutex>

namespace loom {

/**
 * RAII owner of the logging stack for a runtime node.
 *
 * Usage:
 *   - Tests: construct a LogRuntimeGuard in the fixture
 *   - Production: construct from LogRuntime::Config::from_env() at startup
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;  // Empty = LogManager::default_log_dir()

        LogManager::RotationConfig rotation_config;

        bool enable_signal_handlers;
        bool enable_file_watcher;
        std::string control_file_path;

        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , enable_signal_handlers(false)
            , enable_file_watcher(false)
            , control_file_path("/tmp/loom_log_level")
            , initial_level(LOG_INFO) {}

        static Config from_env() {
            Config config;
            if (const char* enable = std::getenv("LOOM_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }
            if (const char* dir = std::getenv("LOOM_LOG_DIR")) {
                config.log_dir = dir;
            }
            if (const char* signals = std::getenv("LOOM_LOG_ENABLE_SIGNALS")) {
                config.enable_signal_handlers = (std::string(signals) != "0");
            }
            if (const char* watcher = std::getenv("LOOM_LOG_ENABLE_WATCHER")) {
                config.enable_file_watcher = (std::string(watcher) != "0");
            }
            if (const char* size = std::getenv("LOOM_LOG_MAX_SIZE_MB")) {
                config.rotation_config.max_file_size = std::stoull(size) * 1024 * 1024;
            }
            if (const char* files = std::getenv("LOOM_LOG_MAX_FILES")) {
                config.rotation_config.max_files = std::stoull(files);
            }
            if (const char* level = std::getenv("LOG_LEVEL")) {
                std::string upper(level);
                for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                if (upper == "TRACE") config.initial_level = LOG_TRACE;
                else if (upper == "DEBUG") config.initial_level = LOG_DEBUG;
                else if (upper == "WARN" || upper == "WARNING") config.initial_level = LOG_WARNING;
                else if (upper == "ERROR") config.initial_level = LOG_ERROR;
                else if (upper == "SEVERE" || upper == "FATAL") config.initial_level = LOG_SEVERE;
            }
            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {
        logLevel.store(config_.initial_level, std::memory_order_relaxed);

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir, config_.rotation_config);
        }
        if (config_.enable_signal_handlers) {
            LogControl::installSignalHandlers();
        }
        if (config_.enable_file_watcher) {
            LogControl::startFileWatcher(config_.control_file_path);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Explicitly shutdown all logging components
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Stop file watcher first (it may be writing logs)
        if (config_.enable_file_watcher) {
            LogControl::stopFileWatcher();
            config_.enable_file_watcher = false;
        }

        Logger::setLogFile(nullptr);
        log_manager_.reset();
    }

    LogManager* log_manager() { return log_manager_.get(); }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: restores the process log level on destruction
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
        Logger::setLogFile(nullptr);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace loom

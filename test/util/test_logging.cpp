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

#include <gtest/gtest.h>
#include "../../src/util/log.h"
#include "../../src/util/logmanager.h"
#include "../../src/util/log_control.h"
#include "../../src/util/log_runtime.h"
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>
#include <thread>
#include <iterator>
#include <vector>
#include <unistd.h>
#include <cstdio>

namespace loom {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;

    void SetUp() override {
        original_log_level = logLevel;
        test_log_dir = "/tmp/loom_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        logLevel = original_log_level;
        Logger::setLogFile(nullptr);
        std::filesystem::remove_all(test_log_dir);
        unsetenv("LOG_LEVEL");
    }

    static bool containsLogMessage(const std::string& content, const std::string& level, const std::string& message) {
        std::regex re("\\[" + level + "\\].*" + message);
        return std::regex_search(content, re);
    }

    static std::string readFile(const std::string& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    // The logger writes with fprintf(stderr); capture by redirecting the descriptor
    std::string captureLogOutput(const std::function<void()>& func) {
        std::string tmp_file = test_log_dir + "/capture.log";
        int saved_stderr = dup(STDERR_FILENO);
        FILE* temp = fopen(tmp_file.c_str(), "w");
        if (!temp) return "";
        dup2(fileno(temp), STDERR_FILENO);

        func();

        fflush(stderr);
        fclose(temp);
        dup2(saved_stderr, STDERR_FILENO);
        close(saved_stderr);

        std::string content = readFile(tmp_file);
        std::filesystem::remove(tmp_file);
        return content;
    }
};

TEST_F(LoggingTest, MessagesBelowTheLevelAreDropped) {
    logLevel = LOG_WARNING;
    std::string out = captureLogOutput([] {
        debug() << "lease renewed";
        info() << "world restored";
        warning() << "claim expired after " << 3 << " attempts";
        error() << "step failed";
    });
    EXPECT_FALSE(containsLogMessage(out, "DEBUG", "lease renewed"));
    EXPECT_FALSE(containsLogMessage(out, "INFO", "world restored"));
    EXPECT_TRUE(containsLogMessage(out, "WARNING", "claim expired after 3 attempts"));
    EXPECT_TRUE(containsLogMessage(out, "ERROR", "step failed"));
}

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("trace"));
    EXPECT_EQ(logLevel, LOG_TRACE);
    EXPECT_TRUE(setLogLevelFromString("WARN"));
    EXPECT_EQ(logLevel, LOG_WARNING);
    EXPECT_TRUE(setLogLevelFromString("fatal"));
    EXPECT_EQ(logLevel, LOG_SEVERE);
    EXPECT_FALSE(setLogLevelFromString("loud"));
    EXPECT_EQ(logLevel, LOG_SEVERE);

    setenv("LOG_LEVEL", "DEBUG", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_DEBUG);
}

TEST_F(LoggingTest, ThreadNameIsPerThread) {
    logLevel = LOG_INFO;
    std::string out = captureLogOutput([] {
        std::thread t([] {
            Logger::get().setThreadName("n1-effects");
            info() << "delivered";
        });
        t.join();
    });
    EXPECT_NE(out.find("[n1-effects] delivered"), std::string::npos);
    EXPECT_EQ(Logger::get().getThreadName(), "loom");
}

TEST_F(LoggingTest, ConcurrentWritersProduceWholeLines) {
    logLevel = LOG_INFO;
    constexpr int kThreads = 4;
    constexpr int kLines = 50;
    std::string out = captureLogOutput([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < kLines; ++i) info() << "writer " << t << " line " << i;
            });
        }
        for (auto& th : threads) th.join();
    });
    std::regex line("writer \\d line \\d+\\n");
    auto begin = std::sregex_iterator(out.begin(), out.end(), line);
    EXPECT_EQ(std::distance(begin, std::sregex_iterator()), kThreads * kLines);
}

TEST_F(LoggingTest, LogManagerWritesAndRotates) {
    LogManager::RotationConfig config;
    config.enable_auto_rotation = false;
    config.max_files = 1;
    logLevel = LOG_INFO;
    {
        LogManager mgr(test_log_dir, config);
        EXPECT_EQ(mgr.path(), test_log_dir + "/loom.log");
        info() << "before rotation";
        mgr.rotate();
        info() << "after first rotation";
        mgr.rotate();
        info() << "after second rotation";
    }

    std::string active = readFile(test_log_dir + "/loom.log");
    EXPECT_TRUE(containsLogMessage(active, "INFO", "after second rotation"));
    EXPECT_FALSE(containsLogMessage(active, "INFO", "before rotation"));

    size_t rotated = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_log_dir)) {
        if (entry.path().filename().string().rfind("loom.log.", 0) == 0) ++rotated;
    }
    EXPECT_EQ(rotated, 1u);
}

TEST_F(LoggingTest, LogControlChangesTheLevelAtRuntime) {
    logLevel = LOG_WARNING;
    LogControl::setLogLevel(LOG_DEBUG);
    EXPECT_EQ(logLevel, LOG_DEBUG);
    EXPECT_EQ(LogControl::getCurrentLogLevelString(), "DEBUG");

    LogControl::increaseLogLevel(0);
    LogControl::processPendingActions();
    EXPECT_EQ(logLevel, LOG_TRACE);

    LogControl::decreaseLogLevel(0);
    LogControl::processPendingActions();
    EXPECT_EQ(logLevel, LOG_DEBUG);
}

TEST_F(LoggingTest, RuntimeConfigComesFromEnvironment) {
    setenv("LOOM_LOG_ENABLE_FILE", "1", 1);
    setenv("LOOM_LOG_DIR", test_log_dir.c_str(), 1);
    setenv("LOOM_LOG_MAX_FILES", "3", 1);
    setenv("LOG_LEVEL", "error", 1);

    LogRuntime::Config config = LogRuntime::Config::from_env();
    EXPECT_TRUE(config.enable_file_logging);
    EXPECT_EQ(config.log_dir, test_log_dir);
    EXPECT_EQ(config.rotation_config.max_files, 3u);
    EXPECT_EQ(config.initial_level, LOG_ERROR);

    {
        LogRuntimeGuard guard(config);
        ASSERT_NE(guard->log_manager(), nullptr);
        EXPECT_EQ(logLevel, LOG_ERROR);
        error() << "written to the file";
    }
    EXPECT_TRUE(containsLogMessage(readFile(test_log_dir + "/loom.log"), "ERROR", "written to the file"));

    unsetenv("LOOM_LOG_ENABLE_FILE");
    unsetenv("LOOM_LOG_DIR");
    unsetenv("LOOM_LOG_MAX_FILES");
}

} // namespace loom

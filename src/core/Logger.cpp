/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to the console inline
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <vector>

namespace Warband {
namespace {

constexpr const char* LOG_ORGANIZATION = "HammerForged";
constexpr const char* LOG_APPLICATION = "Warband";
constexpr const char* LOG_FILE_PREFIX = "warband_";
constexpr size_t LOG_FILES_KEPT = 5;

std::tm localTime(std::time_t time) {
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &time);
#else
    localtime_r(&time, &result);
#endif
    return result;
}

// "YYYY-MM-DD HH:MM:SS.mmm"
std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    const std::tm t = localTime(std::chrono::system_clock::to_time_t(now));
    return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                       t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                       t.tm_hour, t.tm_min, t.tm_sec, ms);
}

void pruneOldLogs(const std::filesystem::path& logDir, size_t keepCount) {
    namespace fs = std::filesystem;

    std::vector<fs::directory_entry> logFiles;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(logDir, ec)) {
        if (entry.path().extension() == ".log" &&
            entry.path().filename().string().starts_with(LOG_FILE_PREFIX)) {
            logFiles.push_back(entry);
        }
    }
    if (logFiles.size() <= keepCount) {
        return;
    }

    // Oldest first
    std::sort(logFiles.begin(), logFiles.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.last_write_time() < b.last_write_time();
              });
    for (size_t i = 0; i < logFiles.size() - keepCount; ++i) {
        fs::remove(logFiles[i].path(), ec);
    }
}

/**
 * @brief Release-build sink: one file per simulation run under the SDL pref path
 *
 * Opened lazily on the first message. If the directory cannot be created
 * the sink stays closed and messages are dropped.
 */
class LogFileSink {
public:
    static LogFileSink& Instance() {
        static LogFileSink instance;
        return instance;
    }

    void write(LogLevel level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        m_stream << std::format("{} [{}] [{}] {}\n", timestampNow(),
                                logLevelToString(level), system, message);
        // Only CRITICAL and ERROR reach here, so flush every line
        m_stream.flush();
    }

    LogFileSink(const LogFileSink&) = delete;
    LogFileSink& operator=(const LogFileSink&) = delete;

private:
    LogFileSink() = default;
    ~LogFileSink() = default;

    void open() {
        m_opened = true;

        char* prefPath = SDL_GetPrefPath(LOG_ORGANIZATION, LOG_APPLICATION);
        if (prefPath == nullptr) {
            return;
        }
        const std::filesystem::path logDir = std::filesystem::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(logDir, LOG_FILES_KEPT);

        const std::tm t = localTime(std::time(nullptr));
        const std::string fileName = std::format("{}{:04}{:02}{:02}_{:02}{:02}{:02}.log", LOG_FILE_PREFIX,
                                                 t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                                                 t.tm_hour, t.tm_min, t.tm_sec);
        m_stream.open(logDir / fileName, std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << std::format("=== {} Log ===\nStarted: {}\n\n", LOG_APPLICATION, timestampNow());
            m_stream.flush();
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
};

} // anonymous namespace

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (!ShouldLog(level)) {
        return;
    }
    LogFileSink::Instance().write(level, system, message);
}

} // namespace Warband

#endif // ifndef DEBUG

/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to stdout
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

#ifndef TETHER_APP_NAME
#define TETHER_APP_NAME "Tether"
#endif

namespace Tether {
namespace {

// CRITICAL and ERROR only, so every line is flushed.
// The file is truncated per run: <pref path>/tether.log
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        if (!m_opened) {
            open();
        }
        if (!m_fileStream.is_open()) {
            return;
        }

        const auto now = std::chrono::floor<std::chrono::seconds>(
            std::chrono::system_clock::now());
        m_fileStream << std::format("{:%F %T} [{}] [{}] {}\n", now, level, system, message)
                     << std::flush;
    }

private:
    FileLogger() = default;
    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void open() {
        m_opened = true;

        char* prefPath = SDL_GetPrefPath("Tether", TETHER_APP_NAME);
        if (prefPath == nullptr) {
            return; // file logging disabled
        }
        const std::filesystem::path logFile = std::filesystem::path(prefPath) / "tether.log";
        SDL_free(prefPath);

        m_fileStream.open(logFile, std::ios::out | std::ios::trunc);
    }

    std::mutex m_fileMutex;
    std::ofstream m_fileStream;
    bool m_opened = false;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace Tether

#endif // ifndef DEBUG

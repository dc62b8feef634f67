/**
 * @file Logger.cpp
 * @brief spdlog-backed implementation of the migrator log
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include "Migrator/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Migrator {
namespace Core {

namespace {

constexpr size_t ROTATED_FILES = 3;

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

/// Strip directories so "(file:line)" stays short
const char* baseName(const char* path) {
    const char* name = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            name = p + 1;
        }
    }
    return name;
}

} // anonymous namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")    return LogLevel::Trace;
    if (lowered == "debug")    return LogLevel::Debug;
    if (lowered == "info")     return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error")    return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off")      return LogLevel::Off;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (spdlogger_) {
        return false;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs, LogOutput::File) && !logFilePath.empty()) {
            std::filesystem::path logPath(logFilePath);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, maxFileSizeMB * 1024 * 1024, ROTATED_FILES));
        }

        // Console is also the fallback when nothing else was usable
        if (hasFlag(outputs, LogOutput::Console) || sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        auto created = std::make_shared<spdlog::logger>("migrator", sinks.begin(), sinks.end());
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        created->set_level(toSpdlogLevel(minLevel));
        created->flush_on(spdlog::level::warn);

        spdlogger_ = std::move(created);
        minLevel_ = minLevel;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spdlogger_ != nullptr && level != LogLevel::Off && level >= minLevel_;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_ || level == LogLevel::Off || level < minLevel_) {
        return;
    }

    if (file != nullptr && line > 0) {
        spdlogger_->log(toSpdlogLevel(level), "({}:{}) {}", baseName(file), line, message);
    } else {
        spdlogger_->log(toSpdlogLevel(level), message);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

} // namespace Core
} // namespace Migrator

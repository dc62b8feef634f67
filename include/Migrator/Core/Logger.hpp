/**
 * @file Logger.hpp
 * @brief Process-wide diagnostics log for the migrator
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * Console and rotating-file output through spdlog. Library code logs through
 * the MIGRATOR_LOG_* macros; until the tool calls Initialize() those calls
 * are no-ops, so tests and embedders get a silent library by default.
 */

#pragma once

#ifndef MIGRATOR_CORE_LOGGER_HPP
#define MIGRATOR_CORE_LOGGER_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <optional>
#include <utility>

namespace spdlog {
class logger;
}

namespace Migrator {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,      ///< Per-rule and per-poll detail
    Info = 2,       ///< One line per patched or skipped target
    Warning = 3,
    Error = 4,      ///< Operation failed, nothing written
    Critical = 5,
    Off = 255
};

/**
 * @brief Where log lines go
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Coloured stdout
    File = 1 << 1       ///< Rotating file at the configured path
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 *        "critical", "off"), case-insensitive
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Singleton log backed by one spdlog logger
 */
class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Create the sinks and start accepting messages
     * @param minLevel Lowest level written
     * @param outputs Console and/or file; None falls back to console
     * @param logFilePath Log file, ignored unless File is set
     * @param maxFileSizeMB Rotation threshold
     * @return false if already initialized or a sink could not be created
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Flush and drop the sinks; later messages are discarded
     */
    void Shutdown();

    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Write one line, prefixed with "(file:line)" when a location is given
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief printf-style variant of Log()
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[512];
        int length = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
        if (length < 0) {
            return;
        }
        if (static_cast<size_t>(length) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, static_cast<size_t>(length)));
            return;
        }

        std::string text(static_cast<size_t>(length) + 1, '\0');
        std::snprintf(text.data(), text.size(), format, std::forward<Args>(args)...);
        text.resize(static_cast<size_t>(length));
        Log(level, text);
    }

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel minLevel_ = LogLevel::Info;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
};

} // namespace Core
} // namespace Migrator

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef MIGRATOR_DISABLE_LOGGING

#define MIGRATOR_LOG_AT(level, msg) \
    ::Migrator::Core::Logger::Instance().Log(::Migrator::Core::LogLevel::level, msg, __FILE__, __LINE__)

#define MIGRATOR_LOG_AT_F(level, fmt, ...) \
    ::Migrator::Core::Logger::Instance().LogFormat(::Migrator::Core::LogLevel::level, fmt, __VA_ARGS__)

#else
#define MIGRATOR_LOG_AT(level, msg) ((void)0)
#define MIGRATOR_LOG_AT_F(level, fmt, ...) ((void)0)
#endif // MIGRATOR_DISABLE_LOGGING

#define MIGRATOR_LOG_TRACE(msg)    MIGRATOR_LOG_AT(Trace, msg)
#define MIGRATOR_LOG_DEBUG(msg)    MIGRATOR_LOG_AT(Debug, msg)
#define MIGRATOR_LOG_INFO(msg)     MIGRATOR_LOG_AT(Info, msg)
#define MIGRATOR_LOG_WARNING(msg)  MIGRATOR_LOG_AT(Warning, msg)
#define MIGRATOR_LOG_ERROR(msg)    MIGRATOR_LOG_AT(Error, msg)
#define MIGRATOR_LOG_CRITICAL(msg) MIGRATOR_LOG_AT(Critical, msg)

#define MIGRATOR_LOG_TRACE_F(fmt, ...)    MIGRATOR_LOG_AT_F(Trace, fmt, __VA_ARGS__)
#define MIGRATOR_LOG_DEBUG_F(fmt, ...)    MIGRATOR_LOG_AT_F(Debug, fmt, __VA_ARGS__)
#define MIGRATOR_LOG_INFO_F(fmt, ...)     MIGRATOR_LOG_AT_F(Info, fmt, __VA_ARGS__)
#define MIGRATOR_LOG_WARNING_F(fmt, ...)  MIGRATOR_LOG_AT_F(Warning, fmt, __VA_ARGS__)
#define MIGRATOR_LOG_ERROR_F(fmt, ...)    MIGRATOR_LOG_AT_F(Error, fmt, __VA_ARGS__)
#define MIGRATOR_LOG_CRITICAL_F(fmt, ...) MIGRATOR_LOG_AT_F(Critical, fmt, __VA_ARGS__)

#endif // MIGRATOR_CORE_LOGGER_HPP

/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading and settings conversion
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/Config.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <errno.h>
#endif

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace Migrator::Config {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

Result<bool> parseBool(const std::string& value) {
    const std::string lowered = lowercase(value);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    return ErrorCode::ConfigInvalid;
}

Result<int64_t> parsePositiveInt(const std::string& value) {
    int64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || parsed <= 0) {
        return ErrorCode::ConfigInvalid;
    }
    return parsed;
}

} // anonymous namespace

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        #ifdef _WIN32
        wchar_t widePath[MAX_PATH];
        if (MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, widePath, MAX_PATH) == 0) {
            return ErrorCode::InvalidPath;
        }

        wchar_t fullPath[MAX_PATH];
        DWORD length = GetFullPathNameW(widePath, MAX_PATH, fullPath, nullptr);
        if (length == 0 || length >= MAX_PATH) {
            return ErrorCode::InvalidPath;
        }

        if (GetFileAttributesW(fullPath) == INVALID_FILE_ATTRIBUTES) {
            return ErrorCode::ConfigFileNotFound;
        }

        char narrowPath[MAX_PATH * 3];
        if (WideCharToMultiByte(CP_UTF8, 0, fullPath, -1,
                                narrowPath, sizeof(narrowPath), nullptr, nullptr) == 0) {
            return ErrorCode::InvalidPath;
        }

        return std::string(narrowPath);
        #else
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
        #endif
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }

        const std::string& allowed = allowedResult.value();

        if (canonicalPath.length() < allowed.length()) {
            return false;
        }

        #ifdef _WIN32
        // Case-insensitive on Windows
        if (_strnicmp(canonicalPath.c_str(), allowed.c_str(),
                     allowed.length()) != 0) {
            return false;
        }
        #else
        if (canonicalPath.compare(0, allowed.length(), allowed) != 0) {
            return false;
        }
        #endif

        return true;
    }

    Result<ByteBuffer> readFile(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        #ifdef _WIN32
        HANDLE hFile = CreateFileA(
            canonPath.c_str(),
            GENERIC_READ,
            FILE_SHARE_READ,
            nullptr,
            OPEN_EXISTING,
            FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN,
            nullptr
        );

        if (hFile == INVALID_HANDLE_VALUE) {
            return GetLastError() == ERROR_ACCESS_DENIED
                ? ErrorCode::AccessDenied
                : ErrorCode::ConfigFileNotFound;
        }

        LARGE_INTEGER fileSize;
        if (!GetFileSizeEx(hFile, &fileSize)) {
            CloseHandle(hFile);
            return ErrorCode::FileReadError;
        }

        if (static_cast<size_t>(fileSize.QuadPart) > options.max_file_size) {
            CloseHandle(hFile);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(fileSize.QuadPart));
        DWORD bytesRead = 0;
        if (!data.empty() && !ReadFile(hFile, data.data(),
                     static_cast<DWORD>(data.size()), &bytesRead, nullptr)) {
            CloseHandle(hFile);
            return ErrorCode::FileReadError;
        }

        CloseHandle(hFile);

        if (bytesRead != data.size()) {
            return ErrorCode::FileReadError;
        }

        return data;

        #else
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return errno == EACCES ? ErrorCode::AccessDenied : ErrorCode::ConfigFileNotFound;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::FileReadError;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(st.st_size);
        ssize_t bytesRead = data.empty() ? 0 : read(fd, data.data(), data.size());
        close(fd);

        if (bytesRead != static_cast<ssize_t>(data.size())) {
            return ErrorCode::FileReadError;
        }

        return data;
        #endif
    }

    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;

        std::string content(reinterpret_cast<const char*>(data.data()),
                           data.size());
        std::istringstream stream(content);
        std::string line;

        while (std::getline(stream, line)) {
            line = trim(line);

            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                MIGRATOR_LOG_WARNING_F("Ignoring configuration line without '=': %s", line.c_str());
                continue;
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (key.empty()) {
                return ErrorCode::ConfigParseFailed;
            }

            // Later assignments win
            config[key] = value;
        }

        return config;
    }
};

ConfigLoader::ConfigLoader()
    : ConfigLoader(Options{}) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFile(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(ByteSpan data) {
    return m_impl->parseConfig(data);
}

// ============================================================================
// Settings conversion
// ============================================================================

Result<MigratorSettings> parseSettings(const ConfigMap& config) {
    MigratorSettings settings;

    for (const auto& [key, value] : config) {
        if (key == "install_dir") {
            settings.installDirectory = value;
        } else if (key == "log.level") {
            auto level = Core::parseLogLevel(value);
            if (!level) {
                MIGRATOR_LOG_ERROR_F("Invalid log level '%s'", value.c_str());
                return ErrorCode::ConfigInvalid;
            }
            settings.logLevel = *level;
        } else if (key == "log.file") {
            settings.logFile = value;
        } else if (key == "quiesce.poll_interval_ms") {
            auto interval = parsePositiveInt(value);
            if (interval.isFailure()) {
                MIGRATOR_LOG_ERROR_F("Invalid poll interval '%s'", value.c_str());
                return interval.error();
            }
            settings.pollInterval = Milliseconds(interval.value());
        } else if (key == "quiesce.max_attempts") {
            auto attempts = parsePositiveInt(value);
            if (attempts.isFailure() || attempts.value() > UINT32_MAX) {
                MIGRATOR_LOG_ERROR_F("Invalid poll attempt count '%s'", value.c_str());
                return ErrorCode::ConfigInvalid;
            }
            settings.maxPollAttempts = static_cast<uint32_t>(attempts.value());
        } else if (key == "prepare.disable_bf2hub_autopatch") {
            auto flag = parseBool(value);
            if (flag.isFailure()) {
                MIGRATOR_LOG_ERROR_F("Invalid boolean '%s' for %s", value.c_str(), key.c_str());
                return flag.error();
            }
            settings.disableCompetingPatcher = flag.value();
        } else if (key == "patch.dry_run") {
            auto flag = parseBool(value);
            if (flag.isFailure()) {
                MIGRATOR_LOG_ERROR_F("Invalid boolean '%s' for %s", value.c_str(), key.c_str());
                return flag.error();
            }
            settings.dryRun = flag.value();
        } else if (key == "patch.lock_file") {
            auto flag = parseBool(value);
            if (flag.isFailure()) {
                MIGRATOR_LOG_ERROR_F("Invalid boolean '%s' for %s", value.c_str(), key.c_str());
                return flag.error();
            }
            settings.lockFile = flag.value();
        } else {
            MIGRATOR_LOG_WARNING_F("Ignoring unknown configuration key '%s'", key.c_str());
        }
    }

    return settings;
}

} // namespace Migrator::Config

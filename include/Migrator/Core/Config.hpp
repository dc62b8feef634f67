/**
 * @file Config.hpp
 * @brief Configuration loading for BF2 Migrator
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * Reads `key = value` configuration files and converts them into the typed
 * settings consumed by the CLI and the migration workflow.
 */

#pragma once

#ifndef MIGRATOR_CORE_CONFIG_HPP
#define MIGRATOR_CORE_CONFIG_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <Migrator/Core/Logger.hpp>
#include <string>
#include <map>
#include <memory>

namespace Migrator::Config {

using ConfigMap = std::map<std::string, std::string>;

/// Configuration file looked up in the working directory when none is given
constexpr const char* DEFAULT_CONFIG_FILE = "bf2-migrator.conf";

/**
 * @brief Configuration file loader
 *
 * - Path canonicalization
 * - Size limits
 * - Optional restriction to a single directory
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 64 * 1024;
        std::string allowed_directory;       // Restrict to directory
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration from memory
     * @param data Configuration text
     * @return Parsed configuration
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Typed settings for the migrator
 */
struct MigratorSettings {
    std::string installDirectory;            ///< Empty: resolve via registry
    Core::LogLevel logLevel = Core::LogLevel::Info;
    std::string logFile;                     ///< Empty: console only
    Milliseconds pollInterval{1000};         ///< Quiescence poll interval
    uint32_t maxPollAttempts = 5;            ///< Quiescence poll attempts
    bool disableCompetingPatcher = true;     ///< Stop BF2Hub from re-patching
    bool dryRun = false;                     ///< Validate but never write
    bool lockFile = true;                    ///< Exclusive lock while patching
};

/**
 * @brief Convert a parsed configuration into typed settings
 *
 * Missing keys keep their defaults; unknown keys are logged and ignored.
 * @return Settings or ConfigInvalid when a value cannot be converted
 */
Result<MigratorSettings> parseSettings(const ConfigMap& config);

} // namespace Migrator::Config

#endif // MIGRATOR_CORE_CONFIG_HPP

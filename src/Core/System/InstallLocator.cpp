/**
 * @file InstallLocator.cpp
 * @brief Install directory resolution
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/InstallLocator.hpp>
#include <Migrator/Core/Logger.hpp>
#include <filesystem>
#include <system_error>
#include <utility>

namespace Migrator::Core {

namespace {

bool isExistingDirectory(const std::string& path) {
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(path, ec);
}

} // anonymous namespace

const std::vector<InstallDirectorySource>& defaultInstallDirectorySources() {
    static const std::vector<InstallDirectorySource> sources = {
        {RegistryHive::LocalMachine,
         "SOFTWARE\\WOW6432Node\\Electronic Arts\\EA Games\\Battlefield 2", "InstallDir"},
        {RegistryHive::CurrentUser,
         "SOFTWARE\\BF2Hub Systems\\BF2Hub Client", "bf2Dir"},
    };
    return sources;
}

InstallDirectoryResolver::InstallDirectoryResolver(KeyStore& keyStore,
                                                   std::vector<InstallDirectorySource> sources)
    : m_keyStore(keyStore)
    , m_sources(std::move(sources)) {}

Result<std::string> InstallDirectoryResolver::resolve(const std::string& overrideDirectory) const {
    if (!overrideDirectory.empty()) {
        if (!isExistingDirectory(overrideDirectory)) {
            MIGRATOR_LOG_ERROR_F("Install directory '%s' does not exist", overrideDirectory.c_str());
            return ErrorCode::DirectoryNotFound;
        }
        return overrideDirectory;
    }

    for (const auto& source : m_sources) {
        auto value = m_keyStore.readString(source.hive, source.keyPath, source.valueName);
        if (value.isFailure()) {
            MIGRATOR_LOG_DEBUG_F("No install directory at %s\\%s: %s",
                                 source.keyPath.c_str(), source.valueName.c_str(),
                                 getErrorMessage(value.error()).data());
            continue;
        }

        const std::string& candidate = value.value();
        if (isExistingDirectory(candidate)) {
            MIGRATOR_LOG_INFO_F("Using install directory '%s'", candidate.c_str());
            return candidate;
        }
        MIGRATOR_LOG_WARNING_F("Registry names '%s' as install directory, but it does not exist",
                               candidate.c_str());
    }

    return ErrorCode::InstallDirectoryNotFound;
}

} // namespace Migrator::Core

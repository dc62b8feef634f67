/**
 * @file InstallLocator.hpp
 * @brief Locates the Battlefield 2 installation directory
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_CORE_INSTALL_LOCATOR_HPP
#define MIGRATOR_CORE_INSTALL_LOCATOR_HPP

#include <Migrator/Core/ErrorCodes.hpp>
#include <Migrator/Core/KeyStore.hpp>
#include <string>
#include <vector>

namespace Migrator::Core {

/**
 * @brief Registry value that may hold the install directory
 */
struct InstallDirectorySource {
    RegistryHive hive;
    std::string keyPath;
    std::string valueName;
};

/**
 * @brief Registry locations consulted in order: EA installer, then BF2Hub client
 */
[[nodiscard]] const std::vector<InstallDirectorySource>& defaultInstallDirectorySources();

/**
 * @brief Resolves the directory holding BF2.exe
 *
 * An explicit override always wins and is never second-guessed: when it does
 * not exist the result is DirectoryNotFound. Without one, each registry source
 * is tried in order and the first value naming an existing directory is used.
 */
class InstallDirectoryResolver {
public:
    explicit InstallDirectoryResolver(KeyStore& keyStore,
                                      std::vector<InstallDirectorySource> sources =
                                          defaultInstallDirectorySources());

    /**
     * @brief Resolve the installation directory
     * @param overrideDirectory Directory given by the user, or empty
     * @return Directory, DirectoryNotFound or InstallDirectoryNotFound
     */
    [[nodiscard]] Result<std::string> resolve(const std::string& overrideDirectory) const;

private:
    KeyStore& m_keyStore;
    std::vector<InstallDirectorySource> m_sources;
};

} // namespace Migrator::Core

#endif // MIGRATOR_CORE_INSTALL_LOCATOR_HPP

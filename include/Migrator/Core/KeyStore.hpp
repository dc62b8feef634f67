/**
 * @file KeyStore.hpp
 * @brief Registry-like settings store
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_CORE_KEY_STORE_HPP
#define MIGRATOR_CORE_KEY_STORE_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Migrator::Core {

/**
 * @brief Root of a key path
 */
enum class RegistryHive : uint8_t {
    CurrentUser,
    LocalMachine
};

/// Name and value of a 32-bit setting
using DWordValue = std::pair<std::string, uint32_t>;

/**
 * @brief Reads and writes values under hierarchical keys
 *
 * Keys are never created. A key (or value) that does not exist is reported
 * as RegistryKeyNotFound so callers can tell "not installed" apart from real
 * access failures (RegistryAccessFailed).
 */
class KeyStore {
public:
    virtual ~KeyStore() = default;

    /**
     * @brief Write 32-bit values under an existing key
     * @param hive Root of @p path
     * @param path Key path, backslash separated
     * @param values Values to write, all under the same key
     */
    [[nodiscard]] virtual Result<void> setDWords(RegistryHive hive,
                                                 const std::string& path,
                                                 const std::vector<DWordValue>& values) = 0;

    /**
     * @brief Read a string value
     */
    [[nodiscard]] virtual Result<std::string> readString(RegistryHive hive,
                                                         const std::string& path,
                                                         const std::string& name) = 0;
};

/**
 * @brief Store backed by the Windows registry
 *
 * On platforms without a registry every key is absent.
 */
[[nodiscard]] std::unique_ptr<KeyStore> createSystemKeyStore();

} // namespace Migrator::Core

#endif // MIGRATOR_CORE_KEY_STORE_HPP

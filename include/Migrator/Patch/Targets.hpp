/**
 * @file Targets.hpp
 * @brief The Battlefield 2 executables the migrator patches
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_PATCH_TARGETS_HPP
#define MIGRATOR_PATCH_TARGETS_HPP

#include <Migrator/Patch/PatchTarget.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace Migrator::Patch {

/// Network library both executables import when no helper is installed
inline constexpr std::string_view DEFAULT_NETWORK_LIBRARY = "WS2_32.dll";

// ============================================================================
// Game client
// ============================================================================

/**
 * @brief Game client binary (BF2.exe), required on every installation
 */
class GameExecutable final : public PatchTarget {
public:
    static constexpr std::string_view FILE_NAME = "BF2.exe";

    /**
     * @brief How one provider's strings look inside BF2.exe
     */
    struct Profile {
        Provider provider;
        std::string_view hostname;
        /// Patched hosts file path, which also tells apart providers sharing a hostname
        std::string_view hostsPath;
        /// Helper library swapped in for WS2_32.dll, if the provider ships one
        std::optional<std::string_view> helperLibrary;
        /// Whether the master server template keeps its "%d" index
        bool masterIndexPlaceholder;
    };

    static const std::vector<Profile>& profiles();

    GameExecutable();

    [[nodiscard]] std::string_view fileName() const noexcept override { return FILE_NAME; }
    [[nodiscard]] bool isOptional() const noexcept override { return false; }
    [[nodiscard]] const FingerprintTable& fingerprints() const override { return m_fingerprints; }

    [[nodiscard]] Result<std::vector<Modification>> buildModifications(
        Provider oldProvider, Provider newProvider) const override;

private:
    FingerprintTable m_fingerprints;
};

// ============================================================================
// Dedicated server
// ============================================================================

/**
 * @brief Dedicated server binary (bf2_w32ded.exe), absent on client-only installs
 */
class ServerExecutable final : public PatchTarget {
public:
    static constexpr std::string_view FILE_NAME = "bf2_w32ded.exe";

    struct Profile {
        Provider provider;
        std::string_view hostname;
        /// Part of the fingerprint, otherwise a GameSpy server would also look like BF2Hub
        std::string_view networkLibrary;
    };

    static const std::vector<Profile>& profiles();

    ServerExecutable();

    [[nodiscard]] std::string_view fileName() const noexcept override { return FILE_NAME; }
    [[nodiscard]] bool isOptional() const noexcept override { return true; }
    [[nodiscard]] const FingerprintTable& fingerprints() const override { return m_fingerprints; }

    [[nodiscard]] Result<std::vector<Modification>> buildModifications(
        Provider oldProvider, Provider newProvider) const override;

private:
    FingerprintTable m_fingerprints;
};

/**
 * @brief Every target in processing order, game client first
 */
[[nodiscard]] const std::vector<const PatchTarget*>& defaultTargets();

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_TARGETS_HPP

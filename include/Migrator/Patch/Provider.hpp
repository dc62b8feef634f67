/**
 * @file Provider.hpp
 * @brief Online-service backends a BF2 binary can be patched to
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_PATCH_PROVIDER_HPP
#define MIGRATOR_PATCH_PROVIDER_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace Migrator::Patch {

/**
 * @brief Backend provider identity
 *
 * New backends are added here and in each target's profile table.
 */
enum class Provider : uint8_t {
    Unknown = 0,
    GameSpy,
    OpenSpy,
    BF2Hub,
    PlayBF2
};

/**
 * @brief Display name ("GameSpy", "OpenSpy", "BF2Hub", "PlayBF2", "unknown")
 */
[[nodiscard]] std::string_view toString(Provider provider) noexcept;

/**
 * @brief Parse a provider name, ignoring case
 * @return Provider, or std::nullopt for anything that is not a known backend
 */
[[nodiscard]] std::optional<Provider> providerFromString(std::string_view name);

/**
 * @brief All known backends, excluding Unknown
 */
[[nodiscard]] const std::vector<Provider>& knownProviders();

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_PROVIDER_HPP

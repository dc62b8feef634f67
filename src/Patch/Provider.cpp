/**
 * @file Provider.cpp
 * @brief Provider names
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Provider.hpp>
#include <cctype>

namespace Migrator::Patch {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string_view toString(Provider provider) noexcept {
    switch (provider) {
        case Provider::GameSpy: return "GameSpy";
        case Provider::OpenSpy: return "OpenSpy";
        case Provider::BF2Hub:  return "BF2Hub";
        case Provider::PlayBF2: return "PlayBF2";
        case Provider::Unknown: break;
    }
    return "unknown";
}

std::optional<Provider> providerFromString(std::string_view name) {
    for (Provider provider : knownProviders()) {
        if (equalsIgnoreCase(name, toString(provider))) {
            return provider;
        }
    }
    return std::nullopt;
}

const std::vector<Provider>& knownProviders() {
    static const std::vector<Provider> providers = {
        Provider::GameSpy,
        Provider::OpenSpy,
        Provider::BF2Hub,
        Provider::PlayBF2,
    };
    return providers;
}

} // namespace Migrator::Patch

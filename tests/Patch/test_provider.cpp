/**
 * @file test_provider.cpp
 * @brief Unit tests for provider names
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Migrator/Patch/Provider.hpp>
#include <string>

using namespace Migrator::Patch;

TEST(ProviderTest, DisplayNames) {
    EXPECT_EQ(toString(Provider::GameSpy), "GameSpy");
    EXPECT_EQ(toString(Provider::OpenSpy), "OpenSpy");
    EXPECT_EQ(toString(Provider::BF2Hub), "BF2Hub");
    EXPECT_EQ(toString(Provider::PlayBF2), "PlayBF2");
    EXPECT_EQ(toString(Provider::Unknown), "unknown");
}

TEST(ProviderTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(providerFromString("openspy"), Provider::OpenSpy);
    EXPECT_EQ(providerFromString("BF2HUB"), Provider::BF2Hub);
    EXPECT_EQ(providerFromString("PlayBF2"), Provider::PlayBF2);
    EXPECT_FALSE(providerFromString("unknown").has_value());
    EXPECT_FALSE(providerFromString("gamespy.com").has_value());
    EXPECT_FALSE(providerFromString("").has_value());
}

TEST(ProviderTest, KnownProvidersRoundTripThroughNames) {
    const auto& providers = knownProviders();
    ASSERT_EQ(providers.size(), 4u);
    for (Provider provider : providers) {
        EXPECT_EQ(providerFromString(std::string(toString(provider))), provider);
    }
}

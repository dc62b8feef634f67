/**
 * @file test_targets.cpp
 * @brief Unit tests for the BF2.exe and bf2_w32ded.exe rule tables
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Targets.hpp>
#include <Migrator/Patch/Patcher.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace Migrator;
using namespace Migrator::Patch;
using namespace Migrator::Testing;

namespace {

const Modification* findRule(const std::vector<Modification>& rules, const std::string& label) {
    auto it = std::find_if(rules.begin(), rules.end(),
                           [&label](const Modification& rule) { return rule.label == label; });
    return it != rules.end() ? &*it : nullptr;
}

size_t countRules(const std::vector<Modification>& rules, const std::string& label) {
    return static_cast<size_t>(std::count_if(rules.begin(), rules.end(),
        [&label](const Modification& rule) { return rule.label == label; }));
}

} // anonymous namespace

// ============================================================================
// Rule table properties
// ============================================================================

TEST(TargetsTest, DefaultTargetsInOrder) {
    const auto& targets = defaultTargets();
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0]->fileName(), "BF2.exe");
    EXPECT_FALSE(targets[0]->isOptional());
    EXPECT_EQ(targets[1]->fileName(), "bf2_w32ded.exe");
    EXPECT_TRUE(targets[1]->isOptional());
}

TEST(TargetsTest, EveryProviderHasAFingerprint) {
    for (const PatchTarget* target : defaultTargets()) {
        const auto& table = target->fingerprints();
        EXPECT_EQ(table.size(), knownProviders().size()) << target->fileName();
        for (Provider provider : knownProviders()) {
            auto it = std::find_if(table.begin(), table.end(),
                                   [provider](const Fingerprint& f) { return f.provider == provider; });
            ASSERT_NE(it, table.end()) << target->fileName() << " " << toString(provider);
            EXPECT_FALSE(it->ridges.empty());
        }
    }
}

TEST(TargetsTest, PaddedPatternsHaveRuleLength) {
    for (const PatchTarget* target : defaultTargets()) {
        for (Provider from : knownProviders()) {
            for (Provider to : knownProviders()) {
                auto rules = target->buildModifications(from, to);
                ASSERT_RESULT_SUCCESS(rules);
                for (const auto& rule : rules.value()) {
                    EXPECT_LE(rule.oldBytes.size(), rule.length) << rule.label;
                    EXPECT_LE(rule.newBytes.size(), rule.length) << rule.label;
                    EXPECT_EQ(rule.paddedOld().size(), rule.length) << rule.label;
                    EXPECT_EQ(rule.paddedNew().size(), rule.length) << rule.label;
                    EXPECT_GE(rule.count, 1u);
                }
            }
        }
    }
}

TEST(TargetsTest, UnknownProviderHasNoRules) {
    for (const PatchTarget* target : defaultTargets()) {
        auto rules = target->buildModifications(Provider::GameSpy, Provider::Unknown);
        ASSERT_TRUE(rules.isFailure());
        EXPECT_EQ(rules.error(), ErrorCode::MissingFingerprint);
        EXPECT_EQ(target->buildModifications(Provider::Unknown, Provider::OpenSpy).error(),
                  ErrorCode::MissingFingerprint);
    }
}

// ============================================================================
// BF2.exe
// ============================================================================

TEST(GameExecutableTest, GameSpyToOpenSpyRules) {
    GameExecutable game;
    auto rules = game.buildModifications(Provider::GameSpy, Provider::OpenSpy);
    ASSERT_RESULT_SUCCESS(rules);
    ASSERT_EQ(rules.value().size(), 10u);

    const auto* hosts = findRule(rules.value(), "hosts path");
    ASSERT_NE(hosts, nullptr);
    EXPECT_EQ(toText(hosts->oldBytes), "\\drivers\\etc\\hosts");
    EXPECT_EQ(toText(hosts->newBytes), "\\drivers\\etz\\hosts");

    const auto* gamestats = findRule(rules.value(), "gamestats host");
    ASSERT_NE(gamestats, nullptr);
    EXPECT_EQ(gamestats->count, 2u);
    EXPECT_EQ(gamestats->length, 21u);

    const auto* login = findRule(rules.value(), "login host");
    ASSERT_NE(login, nullptr);
    EXPECT_EQ(toText(login->newBytes), "gpcm.openspy.net");

    EXPECT_EQ(countRules(rules.value(), "network library"), 0u);
}

TEST(GameExecutableTest, MasterIndexPlaceholderIsAsymmetric) {
    GameExecutable game;

    auto toPlay = game.buildModifications(Provider::GameSpy, Provider::PlayBF2);
    ASSERT_RESULT_SUCCESS(toPlay);
    const auto* forward = findRule(toPlay.value(), "master index host");
    ASSERT_NE(forward, nullptr);
    EXPECT_EQ(toText(forward->oldBytes), "%s.ms%d.gamespy.com");
    EXPECT_EQ(toText(forward->newBytes), "%s.ms.playbf2.ru");

    auto fromPlay = game.buildModifications(Provider::PlayBF2, Provider::OpenSpy);
    ASSERT_RESULT_SUCCESS(fromPlay);
    const auto* backward = findRule(fromPlay.value(), "master index host");
    ASSERT_NE(backward, nullptr);
    EXPECT_EQ(toText(backward->oldBytes), "%s.ms.playbf2.ru");
    EXPECT_EQ(toText(backward->newBytes), "%s.ms%d.openspy.net");
}

TEST(GameExecutableTest, HelperLibraryOnlyForBF2Hub) {
    GameExecutable game;

    auto toHub = game.buildModifications(Provider::GameSpy, Provider::BF2Hub);
    ASSERT_RESULT_SUCCESS(toHub);
    ASSERT_EQ(countRules(toHub.value(), "network library"), 1u);
    const auto* install = findRule(toHub.value(), "network library");
    EXPECT_EQ(toText(install->oldBytes), "WS2_32.dll");
    EXPECT_EQ(toText(install->newBytes), "bf2hbc.dll");

    auto fromHub = game.buildModifications(Provider::BF2Hub, Provider::PlayBF2);
    ASSERT_RESULT_SUCCESS(fromHub);
    ASSERT_EQ(countRules(fromHub.value(), "network library"), 1u);
    const auto* remove = findRule(fromHub.value(), "network library");
    EXPECT_EQ(toText(remove->oldBytes), "bf2hbc.dll");
    EXPECT_EQ(toText(remove->newBytes), "WS2_32.dll");

    for (Provider from : {Provider::GameSpy, Provider::OpenSpy, Provider::PlayBF2}) {
        for (Provider to : {Provider::GameSpy, Provider::OpenSpy, Provider::PlayBF2}) {
            auto rules = game.buildModifications(from, to);
            ASSERT_RESULT_SUCCESS(rules);
            EXPECT_EQ(countRules(rules.value(), "network library"), 0u);
        }
    }
}

TEST(GameExecutableTest, FingerprintsSeparateProvidersSharingAHostname) {
    GameExecutable game;
    const ByteBuffer hub = buildGameImage(Provider::BF2Hub);
    const ByteBuffer gamespy = buildGameImage(Provider::GameSpy);

    EXPECT_EQ(detectProvider(hub, game.fingerprints()).value(), Provider::BF2Hub);
    EXPECT_EQ(detectProvider(gamespy, game.fingerprints()).value(), Provider::GameSpy);
}

// ============================================================================
// bf2_w32ded.exe
// ============================================================================

TEST(ServerExecutableTest, RuleSet) {
    ServerExecutable server;
    auto rules = server.buildModifications(Provider::OpenSpy, Provider::BF2Hub);
    ASSERT_RESULT_SUCCESS(rules);
    ASSERT_EQ(rules.value().size(), 7u);

    EXPECT_EQ(findRule(rules.value(), "login host"), nullptr);
    EXPECT_EQ(findRule(rules.value(), "hosts path"), nullptr);

    const auto* library = findRule(rules.value(), "network library");
    ASSERT_NE(library, nullptr);
    EXPECT_EQ(toText(library->oldBytes), "WS2_32.dll");
    EXPECT_EQ(toText(library->newBytes), "bf2hub.dll");

    const auto* asp = findRule(rules.value(), "ASP URL");
    ASSERT_NE(asp, nullptr);
    EXPECT_EQ(toText(asp->oldBytes), "http://BF2Web.openspy.net/ASP/");
    EXPECT_EQ(toText(asp->newBytes), "http://BF2Web.gamespy.com/ASP/");
}

TEST(ServerExecutableTest, DetectsEveryProvider) {
    ServerExecutable server;
    for (Provider provider : knownProviders()) {
        auto detected = detectProvider(buildServerImage(provider), server.fingerprints());
        ASSERT_RESULT_SUCCESS(detected);
        EXPECT_EQ(detected.value(), provider);
    }
}

/**
 * @file test_report.cpp
 * @brief Unit tests for JSON reports
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Report.hpp>
#include <Migrator/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Migrator;
using namespace Migrator::Patch;
using namespace Migrator::Testing;
using json = nlohmann::json;

TEST(ReportTest, SuccessfulPatchResult) {
    PatchResult result;
    result.targetFile = "BF2.exe";
    result.detected = Provider::GameSpy;
    result.requested = Provider::OpenSpy;
    result.rulesApplied = 10;
    result.changed = true;
    result.fileSize = 4096;
    result.digestBefore = Crypto::HashEngine::sha256(toBytes("abc")).value();

    json j = toJson(result);
    EXPECT_EQ(j["target"].get<std::string>(), "BF2.exe");
    EXPECT_EQ(j["detected"].get<std::string>(), "GameSpy");
    EXPECT_EQ(j["requested"].get<std::string>(), "OpenSpy");
    EXPECT_TRUE(j["changed"].get<bool>());
    EXPECT_FALSE(j["dry_run"].get<bool>());
    EXPECT_EQ(j["rules_applied"].get<size_t>(), 10u);
    EXPECT_EQ(j["file_size"].get<uint64_t>(), 4096u);
    EXPECT_EQ(j["sha256_before"].get<std::string>(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_TRUE(j["sha256_after"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_FALSE(j.contains("rule"));
}

TEST(ReportTest, FailedPatchResultCarriesRule) {
    PatchResult result;
    result.code = ErrorCode::OccurrenceMismatch;
    result.targetFile = "bf2_w32ded.exe";
    result.detected = Provider::BF2Hub;
    result.requested = Provider::GameSpy;
    result.violation = RuleViolation{6, "network library", 1, 0};

    json j = toJson(result);
    ASSERT_TRUE(j["error"].is_object());
    EXPECT_EQ(j["error"]["code"].get<uint16_t>(), static_cast<uint16_t>(ErrorCode::OccurrenceMismatch));
    EXPECT_EQ(j["error"]["message"].get<std::string>(),
              "Binary contains unknown modifications, revert changes first");
    ASSERT_TRUE(j.contains("rule"));
    EXPECT_EQ(j["rule"]["index"].get<size_t>(), 6u);
    EXPECT_EQ(j["rule"]["label"].get<std::string>(), "network library");
    EXPECT_EQ(j["rule"]["expected"].get<size_t>(), 1u);
    EXPECT_EQ(j["rule"]["observed"].get<size_t>(), 0u);
}

TEST(ReportTest, QuiescenceReport) {
    QuiescenceReport report;
    report.state = QuiescenceState::TimedOut;
    report.code = ErrorCode::ProcessTerminationTimeout;
    report.killed = {{100, "BF2.exe"}, {200, "bf2hub.exe"}};
    report.pending = {200};
    report.pollIterations = 5;

    json j = toJson(report);
    EXPECT_EQ(j["state"].get<std::string>(), "timed-out");
    ASSERT_EQ(j["killed"].size(), 2u);
    EXPECT_EQ(j["killed"][1]["pid"].get<ProcessId>(), 200u);
    EXPECT_EQ(j["killed"][1]["name"].get<std::string>(), "bf2hub.exe");
    EXPECT_EQ(j["pending"], json::array({200}));
    EXPECT_EQ(j["poll_iterations"].get<uint32_t>(), 5u);
    EXPECT_TRUE(j["error"].is_object());
}

TEST(ReportTest, MigrationReport) {
    MigrationReport report;
    report.requested = Provider::PlayBF2;
    report.preparation.competingPatcher = CompetingPatcherState::NotInstalled;
    report.preparation.quiescence.state = QuiescenceState::AllExited;

    PatchResult game;
    game.targetFile = "BF2.exe";
    game.detected = Provider::GameSpy;
    game.requested = Provider::PlayBF2;
    game.changed = true;
    report.targets.push_back(game);
    report.skipped.push_back("bf2_w32ded.exe");

    json j = toJson(report);
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["requested"].get<std::string>(), "PlayBF2");
    EXPECT_EQ(j["preparation"]["competing_patcher"].get<std::string>(), "not-installed");
    EXPECT_EQ(j["preparation"]["quiescence"]["state"].get<std::string>(), "all-exited");
    ASSERT_EQ(j["targets"].size(), 1u);
    EXPECT_EQ(j["targets"][0]["target"].get<std::string>(), "BF2.exe");
    EXPECT_EQ(j["skipped"], json::array({"bf2_w32ded.exe"}));
}

TEST(ReportTest, DryRunPreparationListsProcesses) {
    PrepareReport report;
    report.dryRun = true;
    report.wouldKill = {{100, "BF2.exe"}};

    json j = toJson(report);
    ASSERT_EQ(j["would_kill"].size(), 1u);
    EXPECT_EQ(j["would_kill"][0]["pid"].get<ProcessId>(), 100u);
    EXPECT_EQ(j["would_kill"][0]["name"].get<std::string>(), "BF2.exe");
    EXPECT_EQ(j["competing_patcher"].get<std::string>(), "skipped");

    report.dryRun = false;
    report.wouldKill.clear();
    EXPECT_FALSE(toJson(report).contains("would_kill"));
}

TEST(ReportTest, DetectionEntries) {
    std::vector<DetectionEntry> entries(2);
    entries[0].targetFile = "BF2.exe";
    entries[0].provider = Provider::OpenSpy;
    entries[1].targetFile = "bf2_w32ded.exe";
    entries[1].optional = true;
    entries[1].code = ErrorCode::TargetNotPresent;

    json j = toJson(entries);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["provider"].get<std::string>(), "OpenSpy");
    EXPECT_TRUE(j[0]["error"].is_null());
    EXPECT_TRUE(j[1]["optional"].get<bool>());
    EXPECT_EQ(j[1]["provider"].get<std::string>(), "unknown");
    EXPECT_EQ(j[1]["error"]["code"].get<uint16_t>(), static_cast<uint16_t>(ErrorCode::TargetNotPresent));

    // Serializes without throwing
    EXPECT_FALSE(j.dump().empty());
}

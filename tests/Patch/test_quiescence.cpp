/**
 * @file test_quiescence.cpp
 * @brief Unit tests for killing game processes and waiting for them to exit
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Quiescence.hpp>
#include <Migrator/Patch/Migration.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Migrator;
using namespace Migrator::Patch;
using namespace Migrator::Testing;

class QuiescenceTest : public ::testing::Test {
protected:
    QuiescenceReport run(QuiescenceOptions options = {}) {
        QuiescenceController controller(enumerator_, options, sleeper_.function());
        return controller.quiesce(quiescedExecutables());
    }

    FakeProcessEnumerator enumerator_;
    RecordingSleeper sleeper_;
};

TEST_F(QuiescenceTest, NothingRunning) {
    enumerator_.addProcess(10, "explorer.exe");

    QuiescenceReport report = run();
    EXPECT_TRUE(report.isSuccess());
    EXPECT_EQ(report.state, QuiescenceState::AllExited);
    EXPECT_TRUE(report.killed.empty());
    EXPECT_EQ(report.pollIterations, 0u);
    EXPECT_TRUE(enumerator_.terminated.empty());
    EXPECT_TRUE(sleeper_.calls.empty());
}

TEST_F(QuiescenceTest, KilledProcessesExitBeforeFirstPoll) {
    enumerator_.addProcess(10, "explorer.exe");
    enumerator_.addProcess(100, "BF2.exe");
    enumerator_.addProcess(200, "bf2hub.exe");

    QuiescenceReport report = run();
    EXPECT_TRUE(report.isSuccess());
    EXPECT_EQ(report.state, QuiescenceState::AllExited);
    EXPECT_EQ(enumerator_.terminated, (std::vector<ProcessId>{100, 200}));
    ASSERT_EQ(report.killed.size(), 2u);
    EXPECT_EQ(report.killed[0].executableName, "BF2.exe");
    EXPECT_EQ(report.pollIterations, 1u);
    EXPECT_TRUE(report.pending.empty());
    EXPECT_TRUE(sleeper_.calls.empty());
}

TEST_F(QuiescenceTest, WaitsForSlowExit) {
    enumerator_.addProcess(100, "BF2.exe", 2);
    enumerator_.addProcess(300, "bf2_w32ded.exe", 1);

    QuiescenceReport report = run();
    EXPECT_TRUE(report.isSuccess());
    EXPECT_EQ(report.pollIterations, 3u);
    EXPECT_EQ(sleeper_.calls, (std::vector<Milliseconds>{Milliseconds(1000), Milliseconds(1000)}));
}

TEST_F(QuiescenceTest, NamesMatchCaseInsensitively) {
    enumerator_.addProcess(100, "bf2.EXE");
    enumerator_.addProcess(101, "BF2Hub.exe");
    enumerator_.addProcess(102, "BF2.exe.bak");

    QuiescenceReport report = run();
    EXPECT_TRUE(report.isSuccess());
    EXPECT_EQ(enumerator_.terminated, (std::vector<ProcessId>{100, 101}));
}

TEST_F(QuiescenceTest, ProcessThatNeverExitsTimesOut) {
    enumerator_.addProcess(100, "BF2.exe");
    enumerator_.addProcess(200, "BF2.exe", FakeProcessEnumerator::NEVER_EXITS);

    QuiescenceReport report = run();
    EXPECT_FALSE(report.isSuccess());
    EXPECT_EQ(report.state, QuiescenceState::TimedOut);
    EXPECT_EQ(report.code, ErrorCode::ProcessTerminationTimeout);
    EXPECT_EQ(report.pollIterations, 5u);
    EXPECT_EQ(sleeper_.calls.size(), 4u);
    EXPECT_EQ(report.pending, (std::vector<ProcessId>{200}));
    // One listing to enumerate, one per poll
    EXPECT_EQ(enumerator_.listCalls, 6u);
}

TEST_F(QuiescenceTest, CustomPollLimits) {
    enumerator_.addProcess(100, "BF2.exe", FakeProcessEnumerator::NEVER_EXITS);

    QuiescenceOptions options;
    options.pollInterval = Milliseconds(50);
    options.maxAttempts = 2;

    QuiescenceReport report = run(options);
    EXPECT_EQ(report.state, QuiescenceState::TimedOut);
    EXPECT_EQ(report.pollIterations, 2u);
    EXPECT_EQ(sleeper_.calls, (std::vector<Milliseconds>{Milliseconds(50)}));
}

TEST_F(QuiescenceTest, EnumerationFailure) {
    enumerator_.addProcess(100, "BF2.exe");
    enumerator_.listError = ErrorCode::ProcessEnumerationFailed;

    QuiescenceReport report = run();
    EXPECT_EQ(report.state, QuiescenceState::Failed);
    EXPECT_EQ(report.code, ErrorCode::ProcessEnumerationFailed);
    EXPECT_TRUE(enumerator_.terminated.empty());
}

TEST_F(QuiescenceTest, PollingFailure) {
    enumerator_.addProcess(100, "BF2.exe", 1);
    enumerator_.failListingCall = 1;

    QuiescenceReport report = run();
    EXPECT_EQ(report.state, QuiescenceState::Failed);
    EXPECT_EQ(report.code, ErrorCode::ProcessEnumerationFailed);
    EXPECT_EQ(report.pollIterations, 1u);
}

TEST_F(QuiescenceTest, KillFailureStopsImmediately) {
    enumerator_.addProcess(100, "BF2.exe");
    enumerator_.addProcess(200, "bf2hub.exe");
    enumerator_.terminateErrors[100] = ErrorCode::ProcessAccessDenied;

    QuiescenceReport report = run();
    EXPECT_EQ(report.state, QuiescenceState::Failed);
    EXPECT_EQ(report.code, ErrorCode::ProcessAccessDenied);
    EXPECT_TRUE(enumerator_.terminated.empty());
    EXPECT_EQ(report.pollIterations, 0u);
}

TEST_F(QuiescenceTest, LaterKillFailureKeepsEarlierKillsPending) {
    enumerator_.addProcess(100, "BF2.exe");
    enumerator_.addProcess(200, "bf2hub.exe");
    enumerator_.terminateErrors[200] = ErrorCode::ProcessAccessDenied;

    QuiescenceReport report = run();
    EXPECT_EQ(report.state, QuiescenceState::Failed);
    EXPECT_EQ(report.code, ErrorCode::ProcessAccessDenied);
    EXPECT_EQ(enumerator_.terminated, (std::vector<ProcessId>{100}));
    ASSERT_EQ(report.killed.size(), 1u);
    EXPECT_EQ(report.killed[0].pid, 100u);
    EXPECT_EQ(report.pending, (std::vector<ProcessId>{100}));
}

TEST_F(QuiescenceTest, FindRunningKillsNothing) {
    enumerator_.addProcess(10, "explorer.exe");
    enumerator_.addProcess(100, "bf2.EXE");

    QuiescenceController controller(enumerator_, {}, sleeper_.function());
    auto running = controller.findRunning(quiescedExecutables());
    ASSERT_TRUE(running.isSuccess());
    ASSERT_EQ(running.value().size(), 1u);
    EXPECT_EQ(running.value()[0].pid, 100u);
    EXPECT_TRUE(enumerator_.terminated.empty());
}

TEST(QuiescenceStateTest, Names) {
    EXPECT_EQ(toString(QuiescenceState::AllExited), "all-exited");
    EXPECT_EQ(toString(QuiescenceState::TimedOut), "timed-out");
    EXPECT_EQ(toString(QuiescenceState::Failed), "failed");
}

TEST(QuiescedExecutablesTest, GameServerAndHubClient) {
    EXPECT_EQ(quiescedExecutables(),
              (std::vector<std::string>{"BF2.exe", "bf2_w32ded.exe", "bf2hub.exe"}));
}

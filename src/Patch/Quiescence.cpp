/**
 * @file Quiescence.cpp
 * @brief Process quiescence implementation
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Quiescence.hpp>
#include <Migrator/Core/Logger.hpp>
#include <algorithm>
#include <thread>
#include <unordered_set>
#include <utility>

namespace Migrator::Patch {

std::string_view toString(QuiescenceState state) noexcept {
    switch (state) {
        case QuiescenceState::Enumerating: return "enumerating";
        case QuiescenceState::Killing:     return "killing";
        case QuiescenceState::Polling:     return "polling";
        case QuiescenceState::AllExited:   return "all-exited";
        case QuiescenceState::TimedOut:    return "timed-out";
        case QuiescenceState::Failed:      return "failed";
    }
    return "unknown";
}

SleepFunction threadSleeper() {
    return [](Milliseconds duration) { std::this_thread::sleep_for(duration); };
}

QuiescenceController::QuiescenceController(Core::ProcessEnumerator& enumerator,
                                           QuiescenceOptions options,
                                           SleepFunction sleeper)
    : m_enumerator(enumerator)
    , m_options(options)
    , m_sleeper(std::move(sleeper)) {}

Result<std::vector<Core::ProcessInfo>> QuiescenceController::findRunning(
    const std::vector<std::string>& executableNames) const {
    auto processes = m_enumerator.listProcesses();
    if (processes.isFailure()) {
        MIGRATOR_LOG_ERROR("Failed to retrieve process list");
        return processes.error();
    }

    std::vector<Core::ProcessInfo> matches;
    for (auto& process : processes.value()) {
        const bool targeted = std::any_of(executableNames.begin(), executableNames.end(),
            [&process](const std::string& name) {
                return Core::sameExecutableName(process.executableName, name);
            });
        if (targeted) {
            matches.push_back(std::move(process));
        }
    }
    return matches;
}

QuiescenceReport QuiescenceController::quiesce(const std::vector<std::string>& executableNames) {
    QuiescenceReport report;

    auto fail = [&report](ErrorCode code) {
        report.state = QuiescenceState::Failed;
        report.code = code;
        return report;
    };

    // Enumerating
    report.state = QuiescenceState::Enumerating;
    auto targets = findRunning(executableNames);
    if (targets.isFailure()) {
        return fail(targets.error());
    }

    // Killing. Pids killed before a failing kill stay in pending.
    report.state = QuiescenceState::Killing;
    for (const auto& process : targets.value()) {
        auto terminated = m_enumerator.terminate(process.pid);
        if (terminated.isFailure()) {
            MIGRATOR_LOG_ERROR_F("Failed to kill %s (pid %u): %s", process.executableName.c_str(),
                                 process.pid, getErrorMessage(terminated.error()).data());
            return fail(terminated.error());
        }

        MIGRATOR_LOG_DEBUG_F("Killed %s (pid %u)", process.executableName.c_str(), process.pid);
        report.killed.push_back(process);
        report.pending.push_back(process.pid);
    }

    // Polling
    report.state = QuiescenceState::Polling;
    for (uint32_t attempt = 0; !report.pending.empty() && attempt < m_options.maxAttempts; ++attempt) {
        ++report.pollIterations;

        auto running = m_enumerator.listProcesses();
        if (running.isFailure()) {
            MIGRATOR_LOG_ERROR("Failed to check whether killed processes are still running");
            return fail(running.error());
        }

        std::unordered_set<ProcessId> alive;
        for (const auto& process : running.value()) {
            alive.insert(process.pid);
        }

        report.pending.erase(
            std::remove_if(report.pending.begin(), report.pending.end(),
                           [&alive](ProcessId pid) { return alive.count(pid) == 0; }),
            report.pending.end());

        MIGRATOR_LOG_DEBUG_F("Poll %u: %zu killed process(es) still running",
                             report.pollIterations, report.pending.size());

        if (!report.pending.empty() && attempt + 1 < m_options.maxAttempts) {
            m_sleeper(m_options.pollInterval);
        }
    }

    if (!report.pending.empty()) {
        MIGRATOR_LOG_ERROR_F("%zu killed process(es) did not exit after %u polls",
                             report.pending.size(), report.pollIterations);
        report.state = QuiescenceState::TimedOut;
        report.code = ErrorCode::ProcessTerminationTimeout;
        return report;
    }

    report.state = QuiescenceState::AllExited;
    return report;
}

} // namespace Migrator::Patch

/**
 * @file Quiescence.hpp
 * @brief Terminates game processes and waits for them to exit
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_PATCH_QUIESCENCE_HPP
#define MIGRATOR_PATCH_QUIESCENCE_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <Migrator/Core/Process.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Migrator::Patch {

/**
 * @brief Phase a quiesce cycle ended in (or is in)
 */
enum class QuiescenceState : uint8_t {
    Enumerating,
    Killing,
    Polling,
    AllExited,
    TimedOut,
    Failed
};

[[nodiscard]] std::string_view toString(QuiescenceState state) noexcept;

/**
 * @brief Polling policy
 */
struct QuiescenceOptions {
    Milliseconds pollInterval{1000};
    uint32_t maxAttempts = 5;
};

/**
 * @brief Outcome of one quiesce cycle
 */
struct QuiescenceReport {
    QuiescenceState state = QuiescenceState::Enumerating;
    ErrorCode code = ErrorCode::Success;
    std::vector<Core::ProcessInfo> killed;   ///< Processes a kill was issued for
    std::vector<ProcessId> pending;          ///< Killed processes not yet seen to exit
    uint32_t pollIterations = 0;

    [[nodiscard]] bool isSuccess() const noexcept { return code == ErrorCode::Success; }
};

/**
 * @brief Sleeper that blocks the calling thread
 */
[[nodiscard]] SleepFunction threadSleeper();

/**
 * @brief Kills processes that may hold the target executables open
 *
 * Enumerating -> Killing -> Polling (up to maxAttempts) -> AllExited | TimedOut.
 * Each poll checks the process table first and sleeps one interval only when
 * a killed process is still running and another attempt remains. Enumeration
 * and kill errors end the cycle in Failed.
 */
class QuiescenceController {
public:
    QuiescenceController(Core::ProcessEnumerator& enumerator,
                         QuiescenceOptions options = {},
                         SleepFunction sleeper = threadSleeper());

    /**
     * @brief Kill every process whose executable name is in @p executableNames
     *        and wait for all of them to exit
     */
    [[nodiscard]] QuiescenceReport quiesce(const std::vector<std::string>& executableNames);

    /**
     * @brief Running processes whose executable name is in @p executableNames
     *
     * Read-only; nothing is killed.
     */
    [[nodiscard]] Result<std::vector<Core::ProcessInfo>> findRunning(
        const std::vector<std::string>& executableNames) const;

private:
    Core::ProcessEnumerator& m_enumerator;
    QuiescenceOptions m_options;
    SleepFunction m_sleeper;
};

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_QUIESCENCE_HPP

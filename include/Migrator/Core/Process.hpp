/**
 * @file Process.hpp
 * @brief Process table access used to quiesce the game before patching
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_CORE_PROCESS_HPP
#define MIGRATOR_CORE_PROCESS_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Migrator::Core {

/**
 * @brief One entry of the process table
 */
struct ProcessInfo {
    ProcessId pid = 0;
    std::string executableName;  ///< File name only, e.g. "BF2.exe"
};

/**
 * @brief Enumerates and forcefully terminates processes
 *
 * The quiescence logic depends only on this interface, so tests can script
 * the process table instead of killing real processes.
 */
class ProcessEnumerator {
public:
    virtual ~ProcessEnumerator() = default;

    /**
     * @brief Snapshot of running processes
     * @return Process list or ProcessEnumerationFailed
     */
    [[nodiscard]] virtual Result<std::vector<ProcessInfo>> listProcesses() = 0;

    /**
     * @brief Forcefully terminate a process
     *
     * A process that has already exited counts as terminated.
     * @return Success, ProcessAccessDenied or ProcessTerminationFailed
     */
    [[nodiscard]] virtual Result<void> terminate(ProcessId pid) = 0;
};

/**
 * @brief Enumerator backed by the operating system process table
 */
[[nodiscard]] std::unique_ptr<ProcessEnumerator> createSystemProcessEnumerator();

/**
 * @brief ASCII case-insensitive comparison of executable names
 */
[[nodiscard]] bool sameExecutableName(std::string_view a, std::string_view b) noexcept;

} // namespace Migrator::Core

#endif // MIGRATOR_CORE_PROCESS_HPP

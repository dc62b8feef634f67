/**
 * @file Migration.hpp
 * @brief Prepare-and-patch workflow over every BF2 executable
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#pragma once

#ifndef MIGRATOR_PATCH_MIGRATION_HPP
#define MIGRATOR_PATCH_MIGRATION_HPP

#include <Migrator/Core/KeyStore.hpp>
#include <Migrator/Core/Process.hpp>
#include <Migrator/Patch/Patcher.hpp>
#include <Migrator/Patch/Quiescence.hpp>
#include <Migrator/Patch/Targets.hpp>
#include <string>
#include <vector>

namespace Migrator::Patch {

/// Executables stopped before patching: game client, dedicated server, BF2Hub client
[[nodiscard]] const std::vector<std::string>& quiescedExecutables();

/// BF2Hub client settings key (HKCU)
inline constexpr const char* BF2HUB_CLIENT_KEY = "SOFTWARE\\BF2Hub Systems\\BF2Hub Client";

/**
 * @brief What happened to the BF2Hub auto-patcher during preparation
 */
enum class CompetingPatcherState : uint8_t {
    Skipped,        ///< Disabled by configuration
    Disabled,       ///< Auto-patch settings written
    NotInstalled    ///< Settings key does not exist
};

[[nodiscard]] std::string_view toString(CompetingPatcherState state) noexcept;

/**
 * @brief Outcome of prepareForPatch()
 */
struct PrepareReport {
    ErrorCode code = ErrorCode::Success;
    QuiescenceReport quiescence;
    CompetingPatcherState competingPatcher = CompetingPatcherState::Skipped;
    bool dryRun = false;
    std::vector<Core::ProcessInfo> wouldKill;   ///< Dry run only: matching processes left running

    [[nodiscard]] bool isSuccess() const noexcept { return code == ErrorCode::Success; }
};

/**
 * @brief Outcome of migrate()
 */
struct MigrationReport {
    ErrorCode code = ErrorCode::Success;
    Provider requested = Provider::Unknown;
    PrepareReport preparation;
    std::vector<PatchResult> targets;   ///< Targets processed, in order
    std::vector<std::string> skipped;   ///< Optional targets not present

    [[nodiscard]] bool isSuccess() const noexcept { return code == ErrorCode::Success; }
};

/**
 * @brief Detection outcome for one target
 */
struct DetectionEntry {
    std::string targetFile;
    bool optional = false;
    ErrorCode code = ErrorCode::Success;
    Provider provider = Provider::Unknown;
};

/**
 * @brief Workflow settings
 */
struct MigrationOptions {
    QuiescenceOptions quiescence;
    PatchOptions patch;
    bool disableCompetingPatcher = true;
};

/**
 * @brief Stops the game, neutralises the BF2Hub auto-patcher and patches
 *        every target of an installation
 */
class MigrationWorkflow {
public:
    MigrationWorkflow(Core::ProcessEnumerator& enumerator,
                      Core::KeyStore& keyStore,
                      MigrationOptions options = {},
                      SleepFunction sleeper = threadSleeper(),
                      std::vector<const PatchTarget*> targets = defaultTargets());

    /**
     * @brief Quiesce the game processes, then turn off BF2Hub's patch-on-startup
     *
     * A missing BF2Hub key means the auto-patcher is not installed and is not
     * an error. Any other registry failure is. In a dry run nothing is killed
     * and the registry is not written; the processes that would be killed are
     * listed in wouldKill.
     */
    [[nodiscard]] PrepareReport prepareForPatch();

    /**
     * @brief Prepare, then patch every target to @p newProvider
     *
     * Stops at the first fatal failure; later targets are not touched. A
     * missing optional target is recorded as skipped.
     */
    [[nodiscard]] MigrationReport migrate(const std::string& directory, Provider newProvider);

    /**
     * @brief Detect the current provider of every target
     */
    [[nodiscard]] std::vector<DetectionEntry> detectAll(const std::string& directory) const;

private:
    [[nodiscard]] PrepareReport previewPreparation(const QuiescenceController& controller) const;

    Core::ProcessEnumerator& m_enumerator;
    Core::KeyStore& m_keyStore;
    MigrationOptions m_options;
    SleepFunction m_sleeper;
    std::vector<const PatchTarget*> m_targets;
};

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_MIGRATION_HPP

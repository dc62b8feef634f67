/**
 * @file Migration.cpp
 * @brief Prepare-and-patch workflow implementation
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Migration.hpp>
#include <Migrator/Core/Logger.hpp>
#include <utility>

namespace Migrator::Patch {

const std::vector<std::string>& quiescedExecutables() {
    static const std::vector<std::string> names = {
        std::string(GameExecutable::FILE_NAME),
        std::string(ServerExecutable::FILE_NAME),
        "bf2hub.exe",
    };
    return names;
}

std::string_view toString(CompetingPatcherState state) noexcept {
    switch (state) {
        case CompetingPatcherState::Skipped:      return "skipped";
        case CompetingPatcherState::Disabled:     return "disabled";
        case CompetingPatcherState::NotInstalled: return "not-installed";
    }
    return "unknown";
}

MigrationWorkflow::MigrationWorkflow(Core::ProcessEnumerator& enumerator,
                                     Core::KeyStore& keyStore,
                                     MigrationOptions options,
                                     SleepFunction sleeper,
                                     std::vector<const PatchTarget*> targets)
    : m_enumerator(enumerator)
    , m_keyStore(keyStore)
    , m_options(options)
    , m_sleeper(std::move(sleeper))
    , m_targets(std::move(targets)) {}

PrepareReport MigrationWorkflow::prepareForPatch() {
    PrepareReport report;

    QuiescenceController controller(m_enumerator, m_options.quiescence, m_sleeper);
    if (m_options.patch.dryRun) {
        return previewPreparation(controller);
    }

    report.quiescence = controller.quiesce(quiescedExecutables());
    if (!report.quiescence.isSuccess()) {
        report.code = report.quiescence.code;
        return report;
    }

    if (!m_options.disableCompetingPatcher) {
        return report;
    }

    // Otherwise BF2Hub re-applies its own patch on the next start
    auto written = m_keyStore.setDWords(Core::RegistryHive::CurrentUser, BF2HUB_CLIENT_KEY,
                                        {{"hrpApplyOnStartup", 0u}, {"hrpInterval", 0u}});
    if (written.isFailure()) {
        if (written.error() == ErrorCode::RegistryKeyNotFound) {
            MIGRATOR_LOG_INFO("BF2Hub client not installed, nothing to disable");
            report.competingPatcher = CompetingPatcherState::NotInstalled;
            return report;
        }
        MIGRATOR_LOG_ERROR_F("Failed to disable BF2Hub auto-patching: %s",
                             getErrorMessage(written.error()).data());
        report.code = written.error();
        return report;
    }

    MIGRATOR_LOG_INFO("Disabled BF2Hub auto-patching");
    report.competingPatcher = CompetingPatcherState::Disabled;
    return report;
}

PrepareReport MigrationWorkflow::previewPreparation(const QuiescenceController& controller) const {
    PrepareReport report;
    report.dryRun = true;

    auto running = controller.findRunning(quiescedExecutables());
    if (running.isFailure()) {
        report.quiescence.state = QuiescenceState::Failed;
        report.quiescence.code = running.error();
        report.code = running.error();
        return report;
    }

    for (const auto& process : running.value()) {
        MIGRATOR_LOG_INFO_F("Dry run: would kill %s (pid %u)",
                            process.executableName.c_str(), process.pid);
    }
    report.wouldKill = std::move(running.value());
    report.quiescence.state = QuiescenceState::AllExited;
    return report;
}

MigrationReport MigrationWorkflow::migrate(const std::string& directory, Provider newProvider) {
    MigrationReport report;
    report.requested = newProvider;

    report.preparation = prepareForPatch();
    if (!report.preparation.isSuccess()) {
        report.code = report.preparation.code;
        return report;
    }

    Patcher patcher(m_options.patch);
    for (const PatchTarget* target : m_targets) {
        PatchResult result = patcher.patch(*target, directory, newProvider);

        if (result.code == ErrorCode::TargetNotPresent && target->isOptional()) {
            MIGRATOR_LOG_INFO_F("Skipping %s, not installed", result.targetFile.c_str());
            report.skipped.push_back(result.targetFile);
            continue;
        }

        const bool failed = !result.isSuccess();
        if (failed) {
            report.code = result.code;
        }
        report.targets.push_back(std::move(result));
        if (failed) {
            break;
        }
    }

    return report;
}

std::vector<DetectionEntry> MigrationWorkflow::detectAll(const std::string& directory) const {
    Patcher patcher(m_options.patch);
    std::vector<DetectionEntry> entries;

    for (const PatchTarget* target : m_targets) {
        DetectionEntry entry;
        entry.targetFile = std::string(target->fileName());
        entry.optional = target->isOptional();

        auto detected = patcher.detect(*target, directory);
        if (detected.isFailure()) {
            entry.code = detected.error();
        } else {
            entry.provider = detected.value();
        }
        entries.push_back(std::move(entry));
    }

    return entries;
}

} // namespace Migrator::Patch

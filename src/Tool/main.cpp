/**
 * @file main.cpp
 * @brief bf2-migrator command line entry point
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * Usage:
 *   bf2-migrator [--config FILE] [--dir DIR] [--verbose] [--json] [--dry-run] <command>
 *
 * Commands:
 *   providers          List known providers
 *   detect             Show the provider each executable currently uses
 *   patch <provider>   Stop the game and patch every executable to <provider>
 *   revert             Same as "patch GameSpy"
 *   quiesce            Only stop the game, dedicated server and BF2Hub client
 */

#include <Migrator/Core/Config.hpp>
#include <Migrator/Core/InstallLocator.hpp>
#include <Migrator/Core/KeyStore.hpp>
#include <Migrator/Core/Logger.hpp>
#include <Migrator/Core/Process.hpp>
#include <Migrator/Patch/Migration.hpp>
#include <Migrator/Patch/Report.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using Migrator::ErrorCode;
using Migrator::Result;
using Migrator::Config::MigratorSettings;
using Migrator::Core::Logger;
using Migrator::Core::LogLevel;
using Migrator::Core::LogOutput;
using Migrator::Patch::Provider;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    std::string configFile;
    std::string directory;
    bool verbose = false;
    bool json = false;
    bool dryRun = false;
    std::string command;
    std::vector<std::string> arguments;
};

void printUsage(std::ostream& out) {
    out << "bf2-migrator " << Migrator::VERSION_STRING << "\n"
        << "Usage: bf2-migrator [--config FILE] [--dir DIR] [--verbose] [--json] [--dry-run] <command>\n"
        << "\n"
        << "Commands:\n"
        << "  providers          List known providers\n"
        << "  detect             Show the provider each executable currently uses\n"
        << "  patch <provider>   Stop the game and patch every executable to <provider>\n"
        << "  revert             Patch every executable back to GameSpy\n"
        << "  quiesce            Stop BF2.exe, bf2_w32ded.exe and bf2hub.exe\n";
}

std::optional<CommandLine> parseCommandLine(int argc, char** argv) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--config" || arg == "--dir") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            (arg == "--config" ? cmd.configFile : cmd.directory) = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--json") {
            cmd.json = true;
        } else if (arg == "--dry-run") {
            cmd.dryRun = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            return std::nullopt;
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.arguments.push_back(arg);
        }
    }

    if (cmd.command.empty()) {
        return std::nullopt;
    }
    return cmd;
}

/**
 * @brief Settings from the configuration file, overridden by the command line
 *
 * The default file is optional; a file named with --config must exist.
 */
Result<MigratorSettings> loadSettings(const CommandLine& cmd) {
    std::string path = cmd.configFile;
    if (path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(Migrator::Config::DEFAULT_CONFIG_FILE, ec)) {
            path = Migrator::Config::DEFAULT_CONFIG_FILE;
        }
    }

    MigratorSettings settings;
    if (!path.empty()) {
        Migrator::Config::ConfigLoader loader;
        auto config = loader.load(path);
        if (config.isFailure()) {
            std::cerr << "Failed to load " << path << ": "
                      << Migrator::getErrorMessage(config.error()) << "\n";
            return config.error();
        }

        auto parsed = Migrator::Config::parseSettings(config.value());
        if (parsed.isFailure()) {
            std::cerr << "Invalid configuration in " << path << ": "
                      << Migrator::getErrorMessage(parsed.error()) << "\n";
            return parsed.error();
        }
        settings = parsed.value();
    }

    if (!cmd.directory.empty()) {
        settings.installDirectory = cmd.directory;
    }
    if (cmd.verbose) {
        settings.logLevel = LogLevel::Debug;
    }
    if (cmd.dryRun) {
        settings.dryRun = true;
    }
    return settings;
}

void initializeLogging(const MigratorSettings& settings, bool json) {
    LogLevel level = settings.logLevel;
    LogOutput outputs = LogOutput::Console;

    if (!settings.logFile.empty()) {
        outputs = json ? LogOutput::File : (LogOutput::Console | LogOutput::File);
    } else if (json) {
        // Keep stdout clean for the JSON document
        level = LogLevel::Off;
    }

    Logger::Instance().Initialize(level, outputs, settings.logFile);
}

Migrator::Patch::MigrationOptions migrationOptions(const MigratorSettings& settings) {
    Migrator::Patch::MigrationOptions options;
    options.quiescence.pollInterval = settings.pollInterval;
    options.quiescence.maxAttempts = settings.maxPollAttempts;
    options.patch.dryRun = settings.dryRun;
    options.patch.lockFile = settings.lockFile;
    options.disableCompetingPatcher = settings.disableCompetingPatcher;
    return options;
}

// ============================================================================
// Commands
// ============================================================================

int runProviders(bool json) {
    if (json) {
        nlohmann::json list = nlohmann::json::array();
        for (Provider provider : Migrator::Patch::knownProviders()) {
            list.push_back(std::string(Migrator::Patch::toString(provider)));
        }
        std::cout << list.dump(2) << "\n";
        return EXIT_OK;
    }

    for (Provider provider : Migrator::Patch::knownProviders()) {
        std::cout << Migrator::Patch::toString(provider) << "\n";
    }
    return EXIT_OK;
}

int runQuiesce(Migrator::Core::ProcessEnumerator& enumerator,
               const Migrator::Patch::MigrationOptions& options, bool json) {
    Migrator::Patch::QuiescenceController controller(enumerator, options.quiescence);
    auto report = controller.quiesce(Migrator::Patch::quiescedExecutables());

    if (json) {
        std::cout << Migrator::Patch::toJson(report).dump(2) << "\n";
    } else {
        for (const auto& process : report.killed) {
            std::cout << "Killed " << process.executableName << " (pid " << process.pid << ")\n";
        }
        if (report.isSuccess()) {
            std::cout << (report.killed.empty() ? "No game processes running\n"
                                                : "All killed processes exited\n");
        } else {
            std::cerr << Migrator::getErrorMessage(report.code) << "\n";
        }
    }
    return report.isSuccess() ? EXIT_OK : EXIT_OPERATION_FAILED;
}

int runDetect(Migrator::Patch::MigrationWorkflow& workflow, const std::string& directory, bool json) {
    auto entries = workflow.detectAll(directory);

    bool failed = false;
    for (const auto& entry : entries) {
        if (entry.code == ErrorCode::TargetNotPresent && entry.optional) {
            continue;
        }
        failed = failed || entry.code != ErrorCode::Success;
    }

    if (json) {
        std::cout << Migrator::Patch::toJson(entries).dump(2) << "\n";
        return failed ? EXIT_OPERATION_FAILED : EXIT_OK;
    }

    for (const auto& entry : entries) {
        std::cout << entry.targetFile << ": ";
        if (entry.code == ErrorCode::Success) {
            std::cout << Migrator::Patch::toString(entry.provider) << "\n";
        } else {
            std::cout << Migrator::getErrorMessage(entry.code) << "\n";
        }
    }
    return failed ? EXIT_OPERATION_FAILED : EXIT_OK;
}

int runPatch(Migrator::Patch::MigrationWorkflow& workflow, const std::string& directory,
             Provider provider, bool json) {
    auto report = workflow.migrate(directory, provider);

    if (json) {
        std::cout << Migrator::Patch::toJson(report).dump(2) << "\n";
        return report.isSuccess() ? EXIT_OK : EXIT_OPERATION_FAILED;
    }

    if (!report.preparation.isSuccess()) {
        std::cerr << "Failed to prepare for patching: "
                  << Migrator::getErrorMessage(report.preparation.code) << "\n";
        return EXIT_OPERATION_FAILED;
    }

    for (const auto& process : report.preparation.wouldKill) {
        std::cout << "Would kill " << process.executableName << " (pid " << process.pid << ")\n";
    }
    for (const auto& result : report.targets) {
        (result.isSuccess() ? std::cout : std::cerr) << result.describe() << "\n";
    }
    for (const auto& skipped : report.skipped) {
        std::cout << skipped << ": not installed, skipped\n";
    }
    return report.isSuccess() ? EXIT_OK : EXIT_OPERATION_FAILED;
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (cmd->command == "help") {
        printUsage(std::cout);
        return EXIT_OK;
    }

    auto settings = loadSettings(*cmd);
    if (settings.isFailure()) {
        return EXIT_USAGE;
    }

    initializeLogging(settings.value(), cmd->json);
    const auto options = migrationOptions(settings.value());

    if (cmd->command == "providers") {
        return runProviders(cmd->json);
    }

    auto enumerator = Migrator::Core::createSystemProcessEnumerator();
    auto keyStore = Migrator::Core::createSystemKeyStore();

    if (cmd->command == "quiesce") {
        return runQuiesce(*enumerator, options, cmd->json);
    }

    std::optional<Provider> provider;
    if (cmd->command == "patch") {
        if (cmd->arguments.size() != 1) {
            printUsage(std::cerr);
            return EXIT_USAGE;
        }
        provider = Migrator::Patch::providerFromString(cmd->arguments[0]);
        if (!provider) {
            std::cerr << "Unknown provider '" << cmd->arguments[0] << "'\n";
            return EXIT_USAGE;
        }
    } else if (cmd->command == "revert") {
        provider = Provider::GameSpy;
    } else if (cmd->command != "detect") {
        std::cerr << "Unknown command '" << cmd->command << "'\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    Migrator::Core::InstallDirectoryResolver resolver(*keyStore);
    auto directory = resolver.resolve(settings.value().installDirectory);
    if (directory.isFailure()) {
        std::cerr << Migrator::getErrorMessage(directory.error())
                  << " (use --dir or install_dir)\n";
        return EXIT_OPERATION_FAILED;
    }

    Migrator::Patch::MigrationWorkflow workflow(*enumerator, *keyStore, options);

    int exitCode = provider ? runPatch(workflow, directory.value(), *provider, cmd->json)
                            : runDetect(workflow, directory.value(), cmd->json);

    Logger::Instance().Shutdown();
    return exitCode;
}

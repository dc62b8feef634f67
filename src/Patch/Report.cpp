/**
 * @file Report.cpp
 * @brief JSON report rendering
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Report.hpp>
#include <Migrator/Core/Crypto.hpp>

namespace Migrator::Patch {

using json = nlohmann::json;

namespace {

json errorJson(ErrorCode code) {
    if (code == ErrorCode::Success) {
        return nullptr;
    }
    return {
        {"code", static_cast<uint16_t>(code)},
        {"message", std::string(getErrorMessage(code))}
    };
}

json digestJson(const std::optional<SHA256Hash>& digest) {
    if (!digest) {
        return nullptr;
    }
    return Crypto::toHex(*digest);
}

} // anonymous namespace

json toJson(const PatchResult& result) {
    json j = {
        {"target", result.targetFile},
        {"detected", std::string(toString(result.detected))},
        {"requested", std::string(toString(result.requested))},
        {"changed", result.changed},
        {"dry_run", result.dryRun},
        {"rules_applied", result.rulesApplied},
        {"file_size", result.fileSize},
        {"sha256_before", digestJson(result.digestBefore)},
        {"sha256_after", digestJson(result.digestAfter)},
        {"error", errorJson(result.code)}
    };

    if (result.violation) {
        j["rule"] = {
            {"index", result.violation->index},
            {"label", result.violation->label},
            {"expected", result.violation->expected},
            {"observed", result.violation->observed}
        };
    }

    return j;
}

json toJson(const QuiescenceReport& report) {
    json killed = json::array();
    for (const auto& process : report.killed) {
        killed.push_back({{"pid", process.pid}, {"name", process.executableName}});
    }

    return {
        {"state", std::string(toString(report.state))},
        {"killed", killed},
        {"pending", report.pending},
        {"poll_iterations", report.pollIterations},
        {"error", errorJson(report.code)}
    };
}

json toJson(const PrepareReport& report) {
    json j = {
        {"quiescence", toJson(report.quiescence)},
        {"competing_patcher", std::string(toString(report.competingPatcher))},
        {"error", errorJson(report.code)}
    };

    if (report.dryRun) {
        json wouldKill = json::array();
        for (const auto& process : report.wouldKill) {
            wouldKill.push_back({{"pid", process.pid}, {"name", process.executableName}});
        }
        j["would_kill"] = wouldKill;
    }
    return j;
}

json toJson(const MigrationReport& report) {
    json targets = json::array();
    for (const auto& result : report.targets) {
        targets.push_back(toJson(result));
    }

    return {
        {"requested", std::string(toString(report.requested))},
        {"preparation", toJson(report.preparation)},
        {"targets", targets},
        {"skipped", report.skipped},
        {"success", report.isSuccess()},
        {"error", errorJson(report.code)}
    };
}

json toJson(const std::vector<DetectionEntry>& entries) {
    json j = json::array();
    for (const auto& entry : entries) {
        j.push_back({
            {"target", entry.targetFile},
            {"optional", entry.optional},
            {"provider", std::string(toString(entry.provider))},
            {"error", errorJson(entry.code)}
        });
    }
    return j;
}

} // namespace Migrator::Patch

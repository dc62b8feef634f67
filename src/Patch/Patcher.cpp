/**
 * @file Patcher.cpp
 * @brief Provider detection and binary patching implementation
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/Patcher.hpp>
#include <Migrator/Core/BinaryFile.hpp>
#include <Migrator/Core/ByteScanner.hpp>
#include <Migrator/Core/Crypto.hpp>
#include <Migrator/Core/Logger.hpp>
#include <filesystem>
#include <sstream>

namespace Migrator::Patch {

using Core::Binary::BinaryFile;
using Core::Binary::ByteScanner;

// ============================================================================
// Detection and rule application
// ============================================================================

Result<Provider> detectProvider(ByteSpan content, const FingerprintTable& fingerprints) {
    Provider detected = Provider::Unknown;
    size_t matches = 0;

    for (const auto& fingerprint : fingerprints) {
        if (fingerprint.matches(content)) {
            detected = fingerprint.provider;
            ++matches;
        }
    }

    if (matches != 1) {
        MIGRATOR_LOG_ERROR_F("Provider detection matched %zu fingerprints", matches);
        return ErrorCode::UnknownOrMixedState;
    }

    return detected;
}

ApplyOutcome applyModifications(ByteSpan original, const std::vector<Modification>& modifications) {
    ApplyOutcome outcome;
    ByteBuffer modified(original.begin(), original.end());

    for (size_t i = 0; i < modifications.size(); ++i) {
        const Modification& rule = modifications[i];
        const ByteBuffer from = rule.paddedOld();
        const ByteBuffer to = rule.paddedNew();

        const size_t observed = ByteScanner::countOccurrences(modified, from);
        if (observed != rule.count) {
            MIGRATOR_LOG_ERROR_F("Rule %zu (%s) expects %zu occurrence(s) of '%s', found %zu",
                                 i, rule.label.c_str(), rule.count,
                                 toText(rule.oldBytes).c_str(), observed);
            outcome.code = ErrorCode::OccurrenceMismatch;
            outcome.violation = RuleViolation{i, rule.label, rule.count, observed};
            return outcome;
        }

        modified = ByteScanner::replaceAll(modified, from, to);
    }

    // A length change would shift every offset in the executable
    if (modified.size() != original.size()) {
        MIGRATOR_LOG_CRITICAL_F("Modified image is %zu bytes, original is %zu bytes",
                                modified.size(), original.size());
        outcome.code = ErrorCode::LengthInvariantViolation;
        return outcome;
    }

    outcome.content = std::move(modified);
    return outcome;
}

// ============================================================================
// PatchResult
// ============================================================================

std::string PatchResult::describe() const {
    std::ostringstream oss;
    oss << targetFile << ": ";

    if (isSuccess()) {
        if (!changed) {
            oss << "already uses " << toString(requested);
        } else {
            oss << (dryRun ? "would be patched from " : "patched from ")
                << toString(detected) << " to " << toString(requested)
                << " (" << rulesApplied << " rules)";
        }
        return oss.str();
    }

    oss << getErrorMessage(code);
    if (detected != Provider::Unknown) {
        oss << " [" << toString(detected) << " -> " << toString(requested) << "]";
    }
    if (violation) {
        oss << " (rule " << violation->index << " '" << violation->label << "': expected "
            << violation->expected << ", found " << violation->observed << ")";
    }
    return oss.str();
}

// ============================================================================
// Patcher
// ============================================================================

std::string targetPath(const PatchTarget& target, const std::string& directory) {
    return (std::filesystem::path(directory) / std::filesystem::path(target.fileName())).string();
}

Patcher::Patcher(PatchOptions options)
    : m_options(options) {}

PatchResult Patcher::patchBuffer(const PatchTarget& target, ByteBuffer& content,
                                 Provider newProvider) const {
    PatchResult result;
    result.targetFile = std::string(target.fileName());
    result.requested = newProvider;
    result.dryRun = m_options.dryRun;
    result.fileSize = content.size();

    auto detected = detectProvider(content, target.fingerprints());
    if (detected.isFailure()) {
        result.code = detected.error();
        return result;
    }
    result.detected = detected.value();

    MIGRATOR_LOG_INFO_F("%s currently uses %s", result.targetFile.c_str(),
                        toString(result.detected).data());

    if (result.detected == newProvider) {
        return result;
    }

    auto modifications = target.buildModifications(result.detected, newProvider);
    if (modifications.isFailure()) {
        result.code = modifications.error();
        return result;
    }

    ApplyOutcome outcome = applyModifications(content, modifications.value());
    if (outcome.code != ErrorCode::Success) {
        result.code = outcome.code;
        result.violation = std::move(outcome.violation);
        return result;
    }

    content = std::move(outcome.content);
    result.rulesApplied = modifications.value().size();
    result.changed = true;
    return result;
}

Result<Provider> Patcher::detect(const PatchTarget& target, const std::string& directory) const {
    const std::string path = targetPath(target, directory);

    auto file = BinaryFile::openReadOnly(path);
    if (file.isFailure()) {
        return file.error() == ErrorCode::FileNotFound ? ErrorCode::TargetNotPresent : file.error();
    }

    auto content = file.value().readAll();
    if (content.isFailure()) {
        return content.error();
    }

    return detectProvider(content.value(), target.fingerprints());
}

PatchResult Patcher::patch(const PatchTarget& target, const std::string& directory,
                           Provider newProvider) const {
    const std::string path = targetPath(target, directory);

    auto fail = [&](ErrorCode code) {
        PatchResult result;
        result.code = code;
        result.targetFile = std::string(target.fileName());
        result.requested = newProvider;
        result.dryRun = m_options.dryRun;
        return result;
    };

    // A dry run never writes, so it does not need write access or the lock
    auto file = m_options.dryRun ? BinaryFile::openReadOnly(path)
                                 : BinaryFile::open(path, m_options.lockFile);
    if (file.isFailure()) {
        if (file.error() == ErrorCode::FileNotFound) {
            MIGRATOR_LOG_DEBUG_F("%s not found", path.c_str());
            return fail(ErrorCode::TargetNotPresent);
        }
        MIGRATOR_LOG_ERROR_F("Failed to open %s: %s", path.c_str(),
                             getErrorMessage(file.error()).data());
        return fail(file.error());
    }

    auto original = file.value().readAll();
    if (original.isFailure()) {
        return fail(original.error());
    }

    auto digestBefore = Crypto::HashEngine::sha256(original.value());
    if (digestBefore.isFailure()) {
        return fail(digestBefore.error());
    }

    ByteBuffer content = original.value();
    PatchResult result = patchBuffer(target, content, newProvider);
    result.digestBefore = digestBefore.value();

    if (!result.isSuccess()) {
        MIGRATOR_LOG_ERROR(result.describe());
        return result;
    }

    if (!result.changed) {
        result.digestAfter = result.digestBefore;
        MIGRATOR_LOG_INFO(result.describe());
        return result;
    }

    auto digestAfter = Crypto::HashEngine::sha256(content);
    if (digestAfter.isFailure()) {
        result.code = digestAfter.error();
        return result;
    }
    result.digestAfter = digestAfter.value();

    if (m_options.dryRun) {
        MIGRATOR_LOG_INFO(result.describe());
        return result;
    }

    auto written = file.value().writeAll(content);
    if (written.isFailure()) {
        MIGRATOR_LOG_ERROR_F("Failed to write %s: %s", path.c_str(),
                             getErrorMessage(written.error()).data());
        result.code = written.error();
        result.changed = false;
        result.digestAfter.reset();
        return result;
    }

    MIGRATOR_LOG_INFO(result.describe());
    return result;
}

} // namespace Migrator::Patch

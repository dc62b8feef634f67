/**
 * @file Patcher.hpp
 * @brief Provider detection and all-or-nothing binary patching
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * Patching reads the whole executable, transforms it in memory and writes it
 * back in one go. Every rule is validated before the write, so a file is
 * either fully moved to the new provider or left byte-identical.
 */

#pragma once

#ifndef MIGRATOR_PATCH_PATCHER_HPP
#define MIGRATOR_PATCH_PATCHER_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <Migrator/Patch/PatchTarget.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Migrator::Patch {

// ============================================================================
// Detection and rule application
// ============================================================================

/**
 * @brief Determine which provider a file currently talks to
 * @param content Whole file content
 * @param fingerprints Target's fingerprint table
 * @return The single matching provider, or UnknownOrMixedState when none or
 *         several fingerprints match
 */
[[nodiscard]] Result<Provider> detectProvider(ByteSpan content, const FingerprintTable& fingerprints);

/**
 * @brief A rule whose padded old pattern was not found the expected number of times
 */
struct RuleViolation {
    size_t index = 0;       ///< Position in the rule list
    std::string label;
    size_t expected = 0;
    size_t observed = 0;
};

/**
 * @brief Result of applying a rule list to a buffer
 */
struct ApplyOutcome {
    ErrorCode code = ErrorCode::Success;
    ByteBuffer content;                     ///< Transformed buffer, empty on failure
    std::optional<RuleViolation> violation;  ///< Set for OccurrenceMismatch
};

/**
 * @brief Apply every rule in order to a copy of @p original
 *
 * Fails with OccurrenceMismatch on the first rule whose padded old pattern
 * count differs from its expected count, and with LengthInvariantViolation
 * when the transformed buffer length differs from the original.
 */
[[nodiscard]] ApplyOutcome applyModifications(ByteSpan original,
                                              const std::vector<Modification>& modifications);

// ============================================================================
// Patch results
// ============================================================================

/**
 * @brief Outcome of one patch invocation on one target
 */
struct PatchResult {
    ErrorCode code = ErrorCode::Success;
    std::string targetFile;
    Provider detected = Provider::Unknown;
    Provider requested = Provider::Unknown;
    size_t rulesApplied = 0;
    bool changed = false;
    bool dryRun = false;
    std::optional<RuleViolation> violation;
    uint64_t fileSize = 0;
    std::optional<SHA256Hash> digestBefore;
    std::optional<SHA256Hash> digestAfter;

    [[nodiscard]] bool isSuccess() const noexcept { return code == ErrorCode::Success; }

    /**
     * @brief One-line message naming the file, providers and failing rule
     */
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Patch behaviour switches
 */
struct PatchOptions {
    bool dryRun = false;     ///< Run every step except the final write
    bool lockFile = true;    ///< Hold an exclusive lock on the file while patching
};

// ============================================================================
// Patcher
// ============================================================================

/**
 * @brief Detects and patches target executables
 *
 * @example
 * ```cpp
 * Patcher patcher;
 * GameExecutable game;
 * auto result = patcher.patch(game, "C:\\Games\\Battlefield 2", Provider::OpenSpy);
 * if (!result.isSuccess()) {
 *     MIGRATOR_LOG_ERROR(result.describe());
 * }
 * ```
 */
class Patcher {
public:
    explicit Patcher(PatchOptions options = {});

    /**
     * @brief Move an in-memory file image to @p newProvider
     *
     * @p content is replaced by the patched image only on success. A file that
     * already uses @p newProvider is left alone and reported as unchanged.
     */
    [[nodiscard]] PatchResult patchBuffer(const PatchTarget& target, ByteBuffer& content,
                                          Provider newProvider) const;

    /**
     * @brief Detect the provider of the target inside @p directory
     * @return Provider, TargetNotPresent, UnknownOrMixedState or an IO error
     */
    [[nodiscard]] Result<Provider> detect(const PatchTarget& target,
                                          const std::string& directory) const;

    /**
     * @brief Patch the target inside @p directory to @p newProvider
     *
     * A missing file yields TargetNotPresent. Any failure leaves the file
     * untouched.
     */
    [[nodiscard]] PatchResult patch(const PatchTarget& target, const std::string& directory,
                                    Provider newProvider) const;

private:
    PatchOptions m_options;
};

/**
 * @brief Full path of a target inside an install directory
 */
[[nodiscard]] std::string targetPath(const PatchTarget& target, const std::string& directory);

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_PATCHER_HPP

/**
 * @file PatchTarget.hpp
 * @brief Fingerprints, substitution rules and the patchable executable interface
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * A patch target is one executable kind (game client, dedicated server).
 * For every provider it knows a fingerprint: literal byte sequences that are
 * all present in the file exactly when that provider is active. For every
 * (old, new) provider pair it produces the fixed-width substitution rules
 * that move the file from one provider to the other.
 */

#pragma once

#ifndef MIGRATOR_PATCH_PATCH_TARGET_HPP
#define MIGRATOR_PATCH_PATCH_TARGET_HPP

#include <Migrator/Core/Types.hpp>
#include <Migrator/Core/ErrorCodes.hpp>
#include <Migrator/Patch/Provider.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Migrator::Patch {

/**
 * @brief Byte sequences that identify the active provider of a file
 */
struct Fingerprint {
    Provider provider = Provider::Unknown;
    std::vector<ByteBuffer> ridges;

    /**
     * @brief True when every ridge occurs somewhere in @p content
     */
    [[nodiscard]] bool matches(ByteSpan content) const noexcept;
};

/// Fingerprints of every provider a target supports
using FingerprintTable = std::vector<Fingerprint>;

/**
 * @brief One fixed-width substitution rule
 *
 * Both sides are right-padded with null bytes to @c length before matching.
 * The padded old pattern must occur exactly @c count times for the rule to
 * be applicable.
 */
struct Modification {
    std::string label;      ///< Short name used in error reports
    ByteBuffer oldBytes;
    ByteBuffer newBytes;
    size_t length = 0;
    size_t count = 0;

    [[nodiscard]] ByteBuffer paddedOld() const;
    [[nodiscard]] ByteBuffer paddedNew() const;
};

/**
 * @brief Rule from two strings
 */
[[nodiscard]] Modification makeModification(std::string label, std::string_view oldText,
                                             std::string_view newText, size_t length,
                                             size_t count);

/**
 * @brief An executable kind that can be moved between providers
 */
class PatchTarget {
public:
    virtual ~PatchTarget() = default;

    /// File name inside the install directory
    [[nodiscard]] virtual std::string_view fileName() const noexcept = 0;

    /// Optional targets may be missing from an installation
    [[nodiscard]] virtual bool isOptional() const noexcept = 0;

    [[nodiscard]] virtual const FingerprintTable& fingerprints() const = 0;

    /**
     * @brief Rules that move the file from @p oldProvider to @p newProvider
     * @return Rules in application order, or MissingFingerprint when either
     *         provider has no profile for this target
     */
    [[nodiscard]] virtual Result<std::vector<Modification>> buildModifications(
        Provider oldProvider, Provider newProvider) const = 0;
};

} // namespace Migrator::Patch

#endif // MIGRATOR_PATCH_PATCH_TARGET_HPP

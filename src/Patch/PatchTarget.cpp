/**
 * @file PatchTarget.cpp
 * @brief Fingerprint matching and rule padding
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Patch/PatchTarget.hpp>
#include <Migrator/Core/ByteScanner.hpp>
#include <utility>

namespace Migrator::Patch {

using Core::Binary::ByteScanner;

bool Fingerprint::matches(ByteSpan content) const noexcept {
    return !ridges.empty() && ByteScanner::containsAll(content, ridges);
}

ByteBuffer Modification::paddedOld() const {
    return ByteScanner::padRight(oldBytes, 0x00, length);
}

ByteBuffer Modification::paddedNew() const {
    return ByteScanner::padRight(newBytes, 0x00, length);
}

Modification makeModification(std::string label, std::string_view oldText,
                              std::string_view newText, size_t length, size_t count) {
    Modification modification;
    modification.label = std::move(label);
    modification.oldBytes = toBytes(oldText);
    modification.newBytes = toBytes(newText);
    modification.length = length;
    modification.count = count;
    return modification;
}

} // namespace Migrator::Patch

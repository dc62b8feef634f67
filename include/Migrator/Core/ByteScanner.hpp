/**
 * @file ByteScanner.hpp
 * @brief Exact byte-sequence search and substitution over file buffers
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * The binary patcher treats an executable as an opaque byte sequence. All it
 * needs is containment, counting and same-length replacement of literal
 * sequences, implemented here without any knowledge of the file format.
 */

#pragma once

#ifndef MIGRATOR_CORE_BYTE_SCANNER_HPP
#define MIGRATOR_CORE_BYTE_SCANNER_HPP

#include <Migrator/Core/Types.hpp>
#include <vector>

namespace Migrator {
namespace Core {
namespace Binary {

/**
 * @brief Literal byte-sequence scanner
 *
 * Matches are non-overlapping and found left to right: after a match at
 * offset N, scanning resumes at N + needle.size(). An empty needle never
 * matches.
 */
class ByteScanner {
public:
    /**
     * @brief Check whether the needle occurs anywhere in the haystack
     */
    [[nodiscard]] static bool contains(ByteSpan haystack, ByteSpan needle) noexcept;

    /**
     * @brief Check whether every needle occurs in the haystack
     */
    [[nodiscard]] static bool containsAll(ByteSpan haystack,
                                          const std::vector<ByteBuffer>& needles) noexcept;

    /**
     * @brief Count non-overlapping occurrences of the needle
     */
    [[nodiscard]] static size_t countOccurrences(ByteSpan haystack, ByteSpan needle) noexcept;

    /**
     * @brief Offsets of all non-overlapping occurrences of the needle
     */
    [[nodiscard]] static std::vector<size_t> findAll(ByteSpan haystack, ByteSpan needle);

    /**
     * @brief Replace every non-overlapping occurrence of @p from with @p to
     * @return New buffer; equal to the input when the needle does not occur
     *
     * The result has the same length as the input only if from and to have
     * the same length. Callers that depend on that must check it.
     */
    [[nodiscard]] static ByteBuffer replaceAll(ByteSpan haystack, ByteSpan from, ByteSpan to);

    /**
     * @brief Right-pad with a fill byte up to the given length
     *
     * Input that already has at least @p length bytes is returned unchanged
     * (never truncated).
     */
    [[nodiscard]] static ByteBuffer padRight(ByteSpan bytes, Byte fill, size_t length);

private:
    static size_t find(ByteSpan haystack, ByteSpan needle, size_t offset) noexcept;
};

} // namespace Binary
} // namespace Core
} // namespace Migrator

#endif // MIGRATOR_CORE_BYTE_SCANNER_HPP

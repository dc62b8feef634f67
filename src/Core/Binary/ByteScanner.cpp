/**
 * @file ByteScanner.cpp
 * @brief Literal byte-sequence scanning implementation
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/ByteScanner.hpp>
#include <algorithm>
#include <cstring>

namespace Migrator {
namespace Core {
namespace Binary {

namespace {
    constexpr size_t npos = static_cast<size_t>(-1);
}

size_t ByteScanner::find(ByteSpan haystack, ByteSpan needle, size_t offset) noexcept {
    if (needle.empty() || offset > haystack.size() ||
        haystack.size() - offset < needle.size()) {
        return npos;
    }

    const Byte* base = haystack.data();
    const size_t searchLimit = haystack.size() - needle.size() + 1;
    const Byte first = needle[0];

    for (size_t i = offset; i < searchLimit; ++i) {
        // Jump to the next candidate first byte
        const void* hit = std::memchr(base + i, first, searchLimit - i);
        if (hit == nullptr) {
            return npos;
        }
        i = static_cast<size_t>(static_cast<const Byte*>(hit) - base);

        if (std::memcmp(base + i, needle.data(), needle.size()) == 0) {
            return i;
        }
    }

    return npos;
}

bool ByteScanner::contains(ByteSpan haystack, ByteSpan needle) noexcept {
    return find(haystack, needle, 0) != npos;
}

bool ByteScanner::containsAll(ByteSpan haystack,
                              const std::vector<ByteBuffer>& needles) noexcept {
    return std::all_of(needles.begin(), needles.end(), [&](const ByteBuffer& needle) {
        return contains(haystack, needle);
    });
}

size_t ByteScanner::countOccurrences(ByteSpan haystack, ByteSpan needle) noexcept {
    size_t count = 0;
    size_t offset = find(haystack, needle, 0);
    while (offset != npos) {
        ++count;
        offset = find(haystack, needle, offset + needle.size());
    }
    return count;
}

std::vector<size_t> ByteScanner::findAll(ByteSpan haystack, ByteSpan needle) {
    std::vector<size_t> offsets;
    size_t offset = find(haystack, needle, 0);
    while (offset != npos) {
        offsets.push_back(offset);
        offset = find(haystack, needle, offset + needle.size());
    }
    return offsets;
}

ByteBuffer ByteScanner::replaceAll(ByteSpan haystack, ByteSpan from, ByteSpan to) {
    ByteBuffer result;
    result.reserve(haystack.size());

    size_t cursor = 0;
    size_t offset = find(haystack, from, 0);
    while (offset != npos) {
        result.insert(result.end(), haystack.begin() + cursor, haystack.begin() + offset);
        result.insert(result.end(), to.begin(), to.end());
        cursor = offset + from.size();
        offset = find(haystack, from, cursor);
    }
    result.insert(result.end(), haystack.begin() + cursor, haystack.end());

    return result;
}

ByteBuffer ByteScanner::padRight(ByteSpan bytes, Byte fill, size_t length) {
    ByteBuffer padded(bytes.begin(), bytes.end());
    if (padded.size() < length) {
        padded.resize(length, fill);
    }
    return padded;
}

} // namespace Binary
} // namespace Core
} // namespace Migrator

/**
 * @file Types.hpp
 * @brief Core type definitions for BF2 Migrator
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the migrator codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef MIGRATOR_CORE_TYPES_HPP
#define MIGRATOR_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <memory>
#include <functional>
#include <chrono>

namespace Migrator {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw file content
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

/// Process identifier
using ProcessId = uint32_t;

// ============================================================================
// Time Types
// ============================================================================

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Hash Types
// ============================================================================

/// SHA-256 hash (32 bytes)
using SHA256Hash = std::array<Byte, 32>;

// ============================================================================
// Byte Helpers
// ============================================================================

/**
 * @brief Copy the characters of a string into a byte buffer
 *
 * Embedded null characters are preserved.
 */
[[nodiscard]] inline ByteBuffer toBytes(std::string_view text) {
    return ByteBuffer(text.begin(), text.end());
}

/**
 * @brief View the bytes as text (for logging and reports)
 */
[[nodiscard]] inline std::string toText(ByteSpan bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// ============================================================================
// Callback Types
// ============================================================================

/// Callback that suspends the caller for the given duration
using SleepFunction = std::function<void(Milliseconds)>;

} // namespace Migrator

#endif // MIGRATOR_CORE_TYPES_HPP

/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for BF2 Migrator
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 *
 * This file defines all error codes used throughout the migrator, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef MIGRATOR_CORE_ERROR_CODES_HPP
#define MIGRATOR_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <stdexcept>
#include <utility>

namespace Migrator {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system and process errors
    Crypto      = 0x03,  ///< Hashing errors
    Patch       = 0x06,  ///< Binary patching errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Registry    = 0x0D,  ///< Registry / key store errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all migrator operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0300-0x03FF: Crypto errors
 * - 0x0600-0x06FF: Patch errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0D00-0x0DFF: Registry errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Not allowed to open or signal the process
    ProcessAccessDenied = 0x0101,

    /// Operation timed out
    Timeout = 0x0105,

    /// Feature not supported on this platform
    NotSupported = 0x0107,

    /// Failed to enumerate running processes
    ProcessEnumerationFailed = 0x010A,

    /// Failed to terminate a process
    ProcessTerminationFailed = 0x010B,

    /// Terminated processes did not exit within the polling window
    ProcessTerminationTimeout = 0x010C,

    // ========================================================================
    // Crypto Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic crypto error
    CryptoError = 0x0300,

    // ========================================================================
    // Patch Errors (0x0600-0x06FF)
    // ========================================================================

    /// Generic patch error
    PatchError = 0x0600,

    /// Patch target file does not exist in the install directory
    TargetNotPresent = 0x0601,

    /// Binary matches no provider fingerprint, or more than one
    UnknownOrMixedState = 0x0602,

    /// Provider has no fingerprint configured for the target
    MissingFingerprint = 0x0603,

    /// A rule's pattern occurs a different number of times than expected
    OccurrenceMismatch = 0x0604,

    /// Substitution changed the length of the binary
    LengthInvariantViolation = 0x0605,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Configuration value invalid
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    /// Configuration parse error
    ConfigParseFailed = 0x0804,

    /// Game install directory could not be determined
    InstallDirectoryNotFound = 0x0805,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File not found
    FileNotFound = 0x0901,

    /// File access denied
    FileAccessDenied = 0x0902,

    /// File is locked by another process
    FileLocked = 0x0903,

    /// Directory not found
    DirectoryNotFound = 0x0904,

    /// File read error
    FileReadError = 0x0906,

    /// File write error
    FileWriteError = 0x0907,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid path
    InvalidPath = 0x090A,

    /// Access denied
    AccessDenied = 0x090B,

    // ========================================================================
    // Registry Errors (0x0D00-0x0DFF)
    // ========================================================================

    /// Generic registry error
    RegistryError = 0x0D00,

    /// Key or value does not exist
    RegistryKeyNotFound = 0x0D01,

    /// Key exists but could not be read or written
    RegistryAccessFailed = 0x0D02,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Invalid state
    InvalidState = 0xFF03,

    /// Invalid argument
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Either a value or the ErrorCode explaining why there is none
 *
 * Every fallible migrator operation returns one of these; exceptions are
 * reserved for misuse (reading the wrong side of a Result).
 *
 * ```cpp
 * auto detected = patcher.detect(target, directory);
 * if (detected.isFailure()) {
 *     MIGRATOR_LOG_ERROR(getErrorMessage(detected.error()));
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(const T& value) : m_data(value) {}
    Result(T&& value) : m_data(std::move(value)) {}
    Result(ErrorCode error) : m_data(error) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return !isSuccess();
    }

    /// @throws std::logic_error on a failed result
    [[nodiscard]] T& value() & {
        requireValue();
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T& value() const & {
        requireValue();
        return std::get<T>(m_data);
    }

    [[nodiscard]] T&& value() && {
        requireValue();
        return std::get<T>(std::move(m_data));
    }

    /// @throws std::logic_error on a successful result
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<ErrorCode>(m_data);
    }

private:
    void requireValue() const {
        if (isFailure()) {
            throw std::logic_error(std::string("Result holds an error: ") +
                                   std::string(getErrorMessage(std::get<ErrorCode>(m_data))));
        }
    }

    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Outcome of an operation with nothing to return
 */
template<>
class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return !isSuccess();
    }

    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error = ErrorCode::Success;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * MIGRATOR_TRY(file.writeAll(bytes));
 * ```
 */
#define MIGRATOR_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * MIGRATOR_TRY_ASSIGN(content, file.readAll());
 * ```
 */
#define MIGRATOR_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Migrator

#endif // MIGRATOR_CORE_ERROR_CODES_HPP

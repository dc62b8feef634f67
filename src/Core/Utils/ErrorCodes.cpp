/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for error codes and categories
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/ErrorCodes.hpp>

namespace Migrator {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                   return "Success";

        case ErrorCode::SystemError:               return "System error";
        case ErrorCode::ProcessAccessDenied:       return "Access to process denied";
        case ErrorCode::Timeout:                   return "Operation timed out";
        case ErrorCode::NotSupported:              return "Not supported on this platform";
        case ErrorCode::ProcessEnumerationFailed:  return "Failed to retrieve process list";
        case ErrorCode::ProcessTerminationFailed:  return "Failed to kill process";
        case ErrorCode::ProcessTerminationTimeout: return "Timed out waiting for killed processes to exit";

        case ErrorCode::CryptoError:               return "Cryptographic operation failed";

        case ErrorCode::PatchError:                return "Patch error";
        case ErrorCode::TargetNotPresent:          return "Target binary not found in install directory";
        case ErrorCode::UnknownOrMixedState:       return "Binary contains unknown/mixed modifications, revert changes first";
        case ErrorCode::MissingFingerprint:        return "Missing fingerprint for provider";
        case ErrorCode::OccurrenceMismatch:        return "Binary contains unknown modifications, revert changes first";
        case ErrorCode::LengthInvariantViolation:  return "Length of modified binary does not match length of original";

        case ErrorCode::ConfigInvalid:             return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:        return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:         return "Failed to parse configuration";
        case ErrorCode::InstallDirectoryNotFound:  return "Failed to determine Battlefield 2 install directory";

        case ErrorCode::IOError:                   return "I/O error";
        case ErrorCode::FileNotFound:              return "File not found";
        case ErrorCode::FileAccessDenied:          return "File access denied";
        case ErrorCode::FileLocked:                return "File is in use by another process";
        case ErrorCode::DirectoryNotFound:         return "Directory not found";
        case ErrorCode::FileReadError:             return "Failed to read file";
        case ErrorCode::FileWriteError:            return "Failed to write file";
        case ErrorCode::FileTooLarge:              return "File too large";
        case ErrorCode::InvalidPath:               return "Invalid path";
        case ErrorCode::AccessDenied:              return "Access denied";

        case ErrorCode::RegistryError:             return "Registry error";
        case ErrorCode::RegistryKeyNotFound:       return "Registry key or value does not exist";
        case ErrorCode::RegistryAccessFailed:      return "Failed to access registry key";

        case ErrorCode::InternalError:             return "Internal error";
        case ErrorCode::InvalidState:              return "Invalid state";
        case ErrorCode::InvalidArgument:           return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Crypto:   return "Crypto";
        case ErrorCategory::Patch:    return "Patch";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Registry: return "Registry";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Migrator

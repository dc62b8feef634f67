/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error codes and the Result type
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Migrator/Core/ErrorCodes.hpp>
#include <string>

using namespace Migrator;

// ============================================================================
// Error Code Utilities
// ============================================================================

TEST(ErrorCodesTest, CategoryFromHighByte) {
    EXPECT_EQ(getErrorCategory(ErrorCode::Success), ErrorCategory::None);
    EXPECT_EQ(getErrorCategory(ErrorCode::ProcessTerminationTimeout), ErrorCategory::System);
    EXPECT_EQ(getErrorCategory(ErrorCode::CryptoError), ErrorCategory::Crypto);
    EXPECT_EQ(getErrorCategory(ErrorCode::OccurrenceMismatch), ErrorCategory::Patch);
    EXPECT_EQ(getErrorCategory(ErrorCode::InstallDirectoryNotFound), ErrorCategory::Config);
    EXPECT_EQ(getErrorCategory(ErrorCode::FileLocked), ErrorCategory::IO);
    EXPECT_EQ(getErrorCategory(ErrorCode::RegistryKeyNotFound), ErrorCategory::Registry);
    EXPECT_EQ(getErrorCategory(ErrorCode::InvalidArgument), ErrorCategory::Internal);
}

TEST(ErrorCodesTest, PatchMessagesMatchUserFacingText) {
    EXPECT_EQ(getErrorMessage(ErrorCode::UnknownOrMixedState),
              "Binary contains unknown/mixed modifications, revert changes first");
    EXPECT_EQ(getErrorMessage(ErrorCode::OccurrenceMismatch),
              "Binary contains unknown modifications, revert changes first");
    EXPECT_EQ(getErrorMessage(ErrorCode::LengthInvariantViolation),
              "Length of modified binary does not match length of original");
}

TEST(ErrorCodesTest, EveryCodeHasAMessage) {
    const ErrorCode codes[] = {
        ErrorCode::SystemError, ErrorCode::ProcessEnumerationFailed,
        ErrorCode::ProcessTerminationFailed, ErrorCode::ProcessTerminationTimeout,
        ErrorCode::TargetNotPresent, ErrorCode::MissingFingerprint,
        ErrorCode::ConfigInvalid, ErrorCode::FileNotFound, ErrorCode::FileLocked,
        ErrorCode::RegistryAccessFailed, ErrorCode::InvalidState
    };
    for (ErrorCode code : codes) {
        EXPECT_NE(getErrorMessage(code), "Unknown error");
    }
    EXPECT_EQ(getCategoryName(ErrorCategory::Registry), "Registry");
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, HoldsValue) {
    Result<int> result(42);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), 42);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(ResultTest, HoldsError) {
    Result<std::string> result(ErrorCode::FileNotFound);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::FileNotFound);
    try {
        (void)result.value();
        FAIL() << "value() of a failed result must throw";
    } catch (const std::logic_error& e) {
        EXPECT_NE(std::string(e.what()).find(getErrorMessage(ErrorCode::FileNotFound)),
                  std::string::npos);
    }
}

TEST(ResultTest, MovesValueOut) {
    Result<std::string> result(std::string("BF2.exe"));
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "BF2.exe");
}

TEST(ResultTest, VoidResult) {
    auto ok = Result<void>::Success();
    EXPECT_TRUE(ok.isSuccess());
    EXPECT_EQ(ok.error(), ErrorCode::Success);

    Result<void> failed(ErrorCode::FileWriteError);
    EXPECT_TRUE(failed.isFailure());
    EXPECT_EQ(failed.error(), ErrorCode::FileWriteError);
}

namespace {

Result<int> half(int value) {
    if (value % 2 != 0) {
        return ErrorCode::InvalidArgument;
    }
    return value / 2;
}

Result<int> quarter(int value) {
    int halved = 0;
    MIGRATOR_TRY_ASSIGN(halved, half(value));
    return half(halved);
}

Result<void> requireEven(int value) {
    MIGRATOR_TRY(half(value));
    return Result<void>::Success();
}

} // anonymous namespace

TEST(ResultTest, TryMacrosPropagateFailure) {
    EXPECT_EQ(quarter(8).value(), 2);
    EXPECT_EQ(quarter(6).error(), ErrorCode::InvalidArgument);
    EXPECT_EQ(quarter(3).error(), ErrorCode::InvalidArgument);
    EXPECT_TRUE(requireEven(4).isSuccess());
    EXPECT_EQ(requireEven(5).error(), ErrorCode::InvalidArgument);
}

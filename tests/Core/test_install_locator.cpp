/**
 * @file test_install_locator.cpp
 * @brief Unit tests for install directory resolution
 * @author BF2 Migrator Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 BF2 Migrator Team. All rights reserved.
 */

#include <Migrator/Core/InstallLocator.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Migrator;
using namespace Migrator::Core;
using namespace Migrator::Testing;

class InstallLocatorTest : public ::testing::Test {
protected:
    static const InstallDirectorySource& eaSource() {
        return defaultInstallDirectorySources()[0];
    }

    static const InstallDirectorySource& hubSource() {
        return defaultInstallDirectorySources()[1];
    }

    TempDirectory installDir_;
    FakeKeyStore keyStore_;
};

TEST_F(InstallLocatorTest, DefaultSourcesCheckRetailThenBF2Hub) {
    const auto& sources = defaultInstallDirectorySources();
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].hive, RegistryHive::LocalMachine);
    EXPECT_EQ(sources[0].valueName, "InstallDir");
    EXPECT_EQ(sources[1].hive, RegistryHive::CurrentUser);
    EXPECT_EQ(sources[1].keyPath, "SOFTWARE\\BF2Hub Systems\\BF2Hub Client");
    EXPECT_EQ(sources[1].valueName, "bf2Dir");
}

TEST_F(InstallLocatorTest, OverrideWins) {
    keyStore_.setString(eaSource().hive, eaSource().keyPath, eaSource().valueName, "/nowhere");
    InstallDirectoryResolver resolver(keyStore_);

    auto result = resolver.resolve(installDir_.string());
    ASSERT_RESULT_SUCCESS(result);
    EXPECT_EQ(result.value(), installDir_.string());
}

TEST_F(InstallLocatorTest, OverrideMustExist) {
    InstallDirectoryResolver resolver(keyStore_);
    auto result = resolver.resolve((installDir_.path() / "missing").string());
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::DirectoryNotFound);
}

TEST_F(InstallLocatorTest, ReadsRetailRegistryValue) {
    keyStore_.setString(eaSource().hive, eaSource().keyPath, eaSource().valueName,
                        installDir_.string());
    InstallDirectoryResolver resolver(keyStore_);

    auto result = resolver.resolve("");
    ASSERT_RESULT_SUCCESS(result);
    EXPECT_EQ(result.value(), installDir_.string());
}

TEST_F(InstallLocatorTest, FallsBackWhenFirstValueIsStale) {
    keyStore_.setString(eaSource().hive, eaSource().keyPath, eaSource().valueName,
                        (installDir_.path() / "uninstalled").string());
    keyStore_.setString(hubSource().hive, hubSource().keyPath, hubSource().valueName,
                        installDir_.string());
    InstallDirectoryResolver resolver(keyStore_);

    auto result = resolver.resolve("");
    ASSERT_RESULT_SUCCESS(result);
    EXPECT_EQ(result.value(), installDir_.string());
}

TEST_F(InstallLocatorTest, NothingFound) {
    InstallDirectoryResolver resolver(keyStore_);
    auto result = resolver.resolve("");
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::InstallDirectoryNotFound);
}

TEST_F(InstallLocatorTest, RegistryFailureFallsThrough) {
    keyStore_.forcedError = ErrorCode::RegistryAccessFailed;
    InstallDirectoryResolver resolver(keyStore_);
    EXPECT_EQ(resolver.resolve("").error(), ErrorCode::InstallDirectoryNotFound);
}

TEST_F(InstallLocatorTest, CustomSources) {
    keyStore_.setString(RegistryHive::CurrentUser, "Software\\Test", "Path", installDir_.string());
    InstallDirectoryResolver resolver(keyStore_,
                                      {{RegistryHive::CurrentUser, "Software\\Test", "Path"}});
    EXPECT_EQ(resolver.resolve("").value(), installDir_.string());
}

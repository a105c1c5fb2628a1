/**
 * ArkProfile Fixer - Configuration Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"

using arkfix::ConfigManager;
using arkfix::ToolConfig;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for tests
        testDir = std::filesystem::temp_directory_path() / "arkprofile-fixer-config-test";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }
    
    void TearDown() override {
        // Clean up test directory
        std::filesystem::remove_all(testDir);
    }
    
    std::filesystem::path testDir;
};

TEST_F(ConfigManagerTest, InitializesWithDefaults) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    
    const ToolConfig& tool = config.toolConfig();
    EXPECT_EQ(tool.logVerbosity, "info");
    EXPECT_EQ(tool.jsonIndent, 2);
    EXPECT_TRUE(tool.createBackups);
    EXPECT_TRUE(tool.logToFile);
    EXPECT_TRUE(tool.verifyAfterBuild);
    EXPECT_EQ(config.configDirectory(), testDir);
}

TEST_F(ConfigManagerTest, SavesAndLoadsConfig) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    
    ToolConfig changed = config.toolConfig();
    changed.logVerbosity = "debug";
    changed.jsonIndent = 4;
    changed.createBackups = false;
    config.setToolConfig(changed);
    
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_FALSE(config.isFirstRun());
    EXPECT_EQ(config.toolConfig().logVerbosity, "debug");
    EXPECT_EQ(config.toolConfig().jsonIndent, 4);
    EXPECT_FALSE(config.toolConfig().createBackups);
    EXPECT_TRUE(config.toolConfig().verifyAfterBuild);
}

TEST_F(ConfigManagerTest, DetectsFirstRun) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_TRUE(config.isFirstRun());
    
    ASSERT_TRUE(config.save());
    EXPECT_FALSE(config.isFirstRun());
    EXPECT_TRUE(std::filesystem::exists(testDir / "config.json"));
}

TEST_F(ConfigManagerTest, PartialFileKeepsOtherDefaults) {
    {
        std::ofstream file(testDir / "config.json");
        file << R"({"jsonIndent": -1})";
    }
    
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_EQ(config.toolConfig().jsonIndent, -1);
    EXPECT_EQ(config.toolConfig().logVerbosity, "info");
}

TEST_F(ConfigManagerTest, CorruptFileFallsBackToDefaults) {
    {
        std::ofstream file(testDir / "config.json");
        file << "{ not json";
    }
    
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_FALSE(config.isFirstRun());
    EXPECT_EQ(config.toolConfig().jsonIndent, 2);
}

TEST(PlatformTest, LogDirectoryLivesUnderConfig) {
    const std::filesystem::path configDir = "/tmp/arkfix-config";
    EXPECT_EQ(arkfix::Platform::getLogPath(configDir), configDir / "logs");
    EXPECT_FALSE(arkfix::Platform::getConfigPath().empty());
}

TEST(PlatformTest, ExactlyOnePlatformIsSelected) {
    EXPECT_NE(arkfix::Platform::isLinux(), arkfix::Platform::isWindows());
    const std::string folder = arkfix::Platform::getConfigPath().filename().string();
    EXPECT_EQ(folder, "arkprofile-fixer");
}

/**
 * ArkProfile Fixer - Configuration Manager
 * 
 * Loads and saves the tool settings file.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace arkfix {

/**
 * Tool-wide settings
 */
struct ToolConfig {
    std::string logVerbosity = "info";  // debug, info, warning, error
    int jsonIndent = 2;                 // spaces per level in extracted JSON, -1 for compact
    bool createBackups = true;          // keep <file>.bak when overwriting a profile
    bool logToFile = true;
    bool verifyAfterBuild = true;       // run verify on the output of build and clear

    nlohmann::json toJson() const;
    static ToolConfig fromJson(const nlohmann::json& j);
};

/**
 * Central configuration manager
 * 
 * A missing settings file means first run: defaults are used and written
 * on the next save(). An unreadable file is logged and defaults are kept.
 */
class ConfigManager {
public:
    static ConfigManager& instance();
    
    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();
    
    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }
    std::filesystem::path configFile() const;
    
    const ToolConfig& toolConfig() const { return m_toolConfig; }
    void setToolConfig(const ToolConfig& config);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    
    bool loadToolConfig();
    bool saveToolConfig();
    
    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;
    
    ToolConfig m_toolConfig;
};

} // namespace arkfix

/**
 * ArkProfile Fixer - Configuration Manager Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace arkfix {

namespace {
    constexpr const char* TOOL_CONFIG_FILE = "config.json";
}

nlohmann::json ToolConfig::toJson() const {
    nlohmann::json j;
    j["logVerbosity"] = logVerbosity;
    j["jsonIndent"] = jsonIndent;
    j["createBackups"] = createBackups;
    j["logToFile"] = logToFile;
    j["verifyAfterBuild"] = verifyAfterBuild;
    return j;
}

ToolConfig ToolConfig::fromJson(const nlohmann::json& j) {
    ToolConfig config;
    if (j.contains("logVerbosity")) {
        config.logVerbosity = j["logVerbosity"].get<std::string>();
    }
    if (j.contains("jsonIndent")) {
        config.jsonIndent = j["jsonIndent"].get<int>();
    }
    if (j.contains("createBackups")) {
        config.createBackups = j["createBackups"].get<bool>();
    }
    if (j.contains("logToFile")) {
        config.logToFile = j["logToFile"].get<bool>();
    }
    if (j.contains("verifyAfterBuild")) {
        config.verifyAfterBuild = j["verifyAfterBuild"].get<bool>();
    }
    return config;
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_toolConfig = ToolConfig{};
    
    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }
    
    m_isFirstRun = !std::filesystem::exists(configFile());
    
    if (!m_isFirstRun) {
        if (!loadToolConfig()) {
            spdlog::warn("Failed to load tool config, using defaults");
        }
    }
    
    spdlog::debug("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

std::filesystem::path ConfigManager::configFile() const {
    return m_configDirectory / TOOL_CONFIG_FILE;
}

bool ConfigManager::save() {
    return saveToolConfig();
}

void ConfigManager::setToolConfig(const ToolConfig& config) {
    m_toolConfig = config;
    saveToolConfig();
}

bool ConfigManager::loadToolConfig() {
    try {
        std::ifstream file(configFile());
        if (!file.is_open()) {
            return false;
        }
        
        nlohmann::json j = nlohmann::json::parse(file);
        m_toolConfig = ToolConfig::fromJson(j);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load tool config: {}", e.what());
        return false;
    }
}

bool ConfigManager::saveToolConfig() {
    try {
        std::ofstream file(configFile());
        if (!file.is_open()) {
            spdlog::error("Failed to open {} for writing", configFile().string());
            return false;
        }
        file << m_toolConfig.toJson().dump(2);
        m_isFirstRun = false;
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save tool config: {}", e.what());
        return false;
    }
}

} // namespace arkfix

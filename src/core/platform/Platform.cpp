/**
 * ArkProfile Fixer - Platform Common Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Platform.hpp"

// getConfigPath() lives in the platform-specific files:
// - LinuxPlatform.cpp
// - WindowsPlatform.cpp

namespace arkfix {

std::filesystem::path Platform::getLogPath(const std::filesystem::path& configDirectory) {
    return configDirectory / "logs";
}

} // namespace arkfix

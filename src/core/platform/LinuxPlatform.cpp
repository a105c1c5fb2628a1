/**
 * ArkProfile Fixer - Platform Implementation (Linux)
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef ARKFIX_PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>

namespace arkfix {

namespace {
    constexpr const char* APP_DIRECTORY = "arkprofile-fixer";
}

std::filesystem::path Platform::getConfigPath() {
    // Use XDG_CONFIG_HOME if set, otherwise ~/.config
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::filesystem::path(xdgConfig) / APP_DIRECTORY;
    }
    
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / APP_DIRECTORY;
    }
    
    return std::filesystem::path(".config") / APP_DIRECTORY;
}

} // namespace arkfix

#endif // ARKFIX_PLATFORM_LINUX

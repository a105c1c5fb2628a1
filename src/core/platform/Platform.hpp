/**
 * ArkProfile Fixer - Platform Abstraction
 * 
 * Per-platform locations of the tool's own files.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace arkfix {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     * 
     * Linux:   $XDG_CONFIG_HOME/arkprofile-fixer/ or ~/.config/arkprofile-fixer/
     * Windows: %APPDATA%\arkprofile-fixer\
     */
    static std::filesystem::path getConfigPath();
    
    /**
     * Directory holding the rotating log files
     */
    static std::filesystem::path getLogPath(const std::filesystem::path& configDirectory);
    
    static constexpr bool isLinux() {
#ifdef ARKFIX_PLATFORM_LINUX
        return true;
#else
        return false;
#endif
    }
    
    static constexpr bool isWindows() {
#ifdef ARKFIX_PLATFORM_WINDOWS
        return true;
#else
        return false;
#endif
    }
};

} // namespace arkfix

/**
 * ArkProfile Fixer - Platform Implementation (Windows)
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef ARKFIX_PLATFORM_WINDOWS

#include "Platform.hpp"

#include <ShlObj.h>
#include <windows.h>

namespace arkfix {

namespace {

constexpr const char* APP_DIRECTORY = "arkprofile-fixer";

std::filesystem::path getKnownFolderPath(REFKNOWNFOLDERID folderId) {
    PWSTR path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(folderId, 0, nullptr, &path))) {
        std::filesystem::path result(path);
        CoTaskMemFree(path);
        return result;
    }
    return {};
}

}  // namespace

std::filesystem::path Platform::getConfigPath() {
    auto appData = getKnownFolderPath(FOLDERID_RoamingAppData);
    if (!appData.empty()) {
        return appData / APP_DIRECTORY;
    }
    return std::filesystem::path(APP_DIRECTORY);
}

} // namespace arkfix

#endif // ARKFIX_PLATFORM_WINDOWS

/**
 * Diario - Platform Implementation (Windows)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_WINDOWS

#include "Platform.hpp"

#include <QStandardPaths>

#include <ShlObj.h>
#include <windows.h>

namespace diario {

namespace {

/**
 * Resolve a known folder, or an empty path when the shell cannot
 */
std::filesystem::path knownFolder(REFKNOWNFOLDERID folderId) {
    PWSTR raw = nullptr;
    std::filesystem::path folder;
    if (SUCCEEDED(SHGetKnownFolderPath(folderId, KF_FLAG_DEFAULT, nullptr, &raw))) {
        folder = raw;
    }
    // Must be released even when the call fails
    CoTaskMemFree(raw);
    return folder;
}

std::filesystem::path appFolder(REFKNOWNFOLDERID folderId) {
    const auto base = knownFolder(folderId);
    return base.empty() ? std::filesystem::path("diario") : base / "diario";
}

} // anonymous namespace

std::filesystem::path Platform::getConfigPath() {
    return appFolder(FOLDERID_RoamingAppData);
}

std::filesystem::path Platform::getDataPath() {
    return appFolder(FOLDERID_LocalAppData);
}

std::filesystem::path Platform::getDocumentsPath() {
    auto documents = knownFolder(FOLDERID_Documents);
    if (documents.empty()) {
        documents = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation).toStdWString();
    }
    return documents;
}

} // namespace diario

#endif // PLATFORM_WINDOWS

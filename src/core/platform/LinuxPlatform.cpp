/**
 * Diario - Platform Implementation (Linux)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"
#include "core/PathConversion.hpp"

#include <cstdlib>

#include <QStandardPaths>

namespace diario {

namespace {

/**
 * Resolve an XDG base directory, falling back to a path under $HOME
 */
std::filesystem::path xdgPath(const char* variable, const std::filesystem::path& homeRelative) {
    const char* xdg = std::getenv(variable);
    if (xdg && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "diario";
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / homeRelative / "diario";
    }

    return homeRelative / "diario";
}

} // anonymous namespace

std::filesystem::path Platform::getConfigPath() {
    return xdgPath("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::getDataPath() {
    return xdgPath("XDG_DATA_HOME", std::filesystem::path(".local") / "share");
}

std::filesystem::path Platform::getDocumentsPath() {
    QString docsPath = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    if (docsPath.isEmpty()) {
        const char* home = std::getenv("HOME");
        return home ? std::filesystem::path(home) : std::filesystem::current_path();
    }
    return toPath(docsPath);
}

} // namespace diario

#endif // PLATFORM_LINUX

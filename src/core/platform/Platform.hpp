/**
 * Diario - Platform Abstraction
 *
 * Per-user directories for configuration, data and documents.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace diario {

/**
 * Well-known per-user locations
 *
 * Implemented once per OS (LinuxPlatform.cpp, WindowsPlatform.cpp). None of
 * these create the directory they return.
 */
class Platform {
public:
    /**
     * Directory holding config.json and logs/
     *
     * Linux:   $XDG_CONFIG_HOME/diario or ~/.config/diario
     * Windows: %APPDATA%\diario
     */
    static std::filesystem::path getConfigPath();

    /**
     * Directory holding the default journal_data.json
     *
     * Linux:   $XDG_DATA_HOME/diario or ~/.local/share/diario
     * Windows: %LOCALAPPDATA%\diario
     */
    static std::filesystem::path getDataPath();

    // Default export location
    static std::filesystem::path getDocumentsPath();
};

} // namespace diario

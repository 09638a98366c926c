/**
 * Diario - Configuration Manager
 *
 * Loads and saves the program settings file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace diario {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    // Paths are stored as UTF-8
    std::string dataFile;                      // Empty: <data dir>/journal_data.json
    std::string backgroundColor = "#fffef5";   // Editor background, #rrggbb
    std::string exportDirectory;               // Empty: Documents
    std::string logVerbosity = "info";         // debug, info, warning, error
};

/**
 * Central configuration manager
 *
 * Handles loading, saving, and providing access to config.json. Missing
 * keys keep their defaults; an unreadable file leaves every default in place.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }

    // Program config
    const ProgramConfig& programConfig() const { return m_programConfig; }
    bool setProgramConfig(const ProgramConfig& config);

    /**
     * Resolved location of the journal file
     */
    std::filesystem::path dataFilePath() const;

    /**
     * Resolved directory offered first when exporting
     */
    std::filesystem::path exportDirectoryPath() const;

private:
    std::filesystem::path configFilePath() const;
    bool loadProgramConfig();
    bool saveProgramConfig();

    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
};

} // namespace diario

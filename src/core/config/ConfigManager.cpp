/**
 * Diario - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"
#include "core/PathConversion.hpp"
#include "core/platform/Platform.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace diario {

namespace {
    constexpr const char* CONFIG_FILE_NAME = "config.json";
    constexpr const char* DATA_FILE_NAME = "journal_data.json";
}

// Missing keys keep the value already in config
void from_json(const nlohmann::json& j, ProgramConfig& config) {
    config.dataFile = j.value("dataFile", config.dataFile);
    config.backgroundColor = j.value("backgroundColor", config.backgroundColor);
    config.exportDirectory = j.value("exportDirectory", config.exportDirectory);
    config.logVerbosity = j.value("logVerbosity", config.logVerbosity);
}

void to_json(nlohmann::json& j, const ProgramConfig& config) {
    j = nlohmann::json{
        {"dataFile", config.dataFile},
        {"backgroundColor", config.backgroundColor},
        {"exportDirectory", config.exportDirectory},
        {"logVerbosity", config.logVerbosity},
    };
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_programConfig = ProgramConfig{};

    std::error_code ec;
    std::filesystem::create_directories(m_configDirectory, ec);
    if (ec) {
        spdlog::error("Cannot create config directory {}: {}", displayPath(m_configDirectory), ec.message());
        return false;
    }

    m_isFirstRun = !std::filesystem::exists(configFilePath());
    if (!m_isFirstRun && !loadProgramConfig()) {
        spdlog::warn("Ignoring {}, falling back to default settings", displayPath(configFilePath()));
    }

    spdlog::debug("Settings directory: {}", displayPath(m_configDirectory));
    return true;
}

bool ConfigManager::save() {
    return saveProgramConfig();
}

bool ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    return saveProgramConfig();
}

std::filesystem::path ConfigManager::configFilePath() const {
    return m_configDirectory / CONFIG_FILE_NAME;
}

std::filesystem::path ConfigManager::dataFilePath() const {
    if (m_programConfig.dataFile.empty()) {
        return Platform::getDataPath() / DATA_FILE_NAME;
    }
    return toPath(QString::fromStdString(m_programConfig.dataFile));
}

std::filesystem::path ConfigManager::exportDirectoryPath() const {
    if (m_programConfig.exportDirectory.empty()) {
        return Platform::getDocumentsPath();
    }
    return toPath(QString::fromStdString(m_programConfig.exportDirectory));
}

bool ConfigManager::loadProgramConfig() {
    std::ifstream in(configFilePath());
    if (!in) {
        spdlog::error("Cannot open {}", displayPath(configFilePath()));
        return false;
    }

    // A partially applied file is worse than none
    ProgramConfig loaded;
    try {
        nlohmann::json::parse(in).get_to(loaded);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid settings in {}: {}", displayPath(configFilePath()), e.what());
        return false;
    }

    m_programConfig = loaded;
    return true;
}

bool ConfigManager::saveProgramConfig() {
    const auto target = configFilePath();
    auto staging = target;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::trunc);
        out << nlohmann::json(m_programConfig).dump(2) << '\n';
        if (!out) {
            spdlog::error("Cannot write settings to {}", displayPath(staging));
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", displayPath(target), ec.message());
        std::filesystem::remove(staging, ec);
        return false;
    }

    spdlog::debug("Saved settings to {}", displayPath(target));
    return true;
}

} // namespace diario

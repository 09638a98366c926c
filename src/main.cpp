/**
 * Diario - Daily journal and poetry notebook
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include <QApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QMessageBox>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "core/JournalStore.hpp"
#include "core/PathConversion.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "ui/JournalWindow.hpp"

namespace {

spdlog::level::level_enum parseLogLevel(const std::string& verbosity) {
    if (verbosity == "debug") return spdlog::level::debug;
    if (verbosity == "warning") return spdlog::level::warn;
    if (verbosity == "error") return spdlog::level::err;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> setupLogging(
        const std::filesystem::path& configPath) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    auto logPath = configPath / "logs" / "diario.log";

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    try {
        // Ensure log directory exists
        std::filesystem::create_directories(logPath.parent_path());

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    } catch (const std::exception& e) {
        fprintf(stderr, "Logging to console only, cannot open %s: %s\n",
                diario::displayPath(logPath).c_str(), e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("diario", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("Diario starting up...");
    return console_sink;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("Diario");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("diario");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Daily journal and poetry notebook");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption dataFileOption(
        QStringList() << "d" << "data-file",
        "Journal data file (overrides the configured one)",
        "file"
    );
    parser.addOption(dataFileOption);

    QCommandLineOption verboseOption(
        QStringList() << "verbose",
        "Print debug messages to the console"
    );
    parser.addOption(verboseOption);

    parser.process(app);

    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = diario::toPath(parser.value(configDirOption));
    } else {
        configPath = diario::Platform::getConfigPath();
    }

    // Setup logging
    auto console_sink = setupLogging(configPath);

    // Initialize configuration
    diario::ConfigManager configManager;
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return 1;
    }
    if (configManager.isFirstRun()) {
        spdlog::info("First run detected, writing default configuration");
        if (!configManager.save()) {
            spdlog::warn("Could not write default configuration");
        }
    }

    console_sink->set_level(parser.isSet(verboseOption)
        ? spdlog::level::debug
        : parseLogLevel(configManager.programConfig().logVerbosity));

    spdlog::info("Configuration loaded from: {}", diario::displayPath(configPath));

    std::filesystem::path dataFile = configManager.dataFilePath();
    if (parser.isSet(dataFileOption)) {
        dataFile = diario::toPath(parser.value(dataFileOption));
    }

    diario::JournalStore store(dataFile);
    if (auto error = store.load(QDate::currentDate())) {
        spdlog::warn("Journal load reported {}: {}",
                     diario::storeErrorCodeToString(error->code), error->message);
        const QString title = error->code == diario::StoreErrorCode::CorruptData
            ? "Corrupt data"
            : "Journal unavailable";
        QMessageBox::warning(nullptr, title,
            QString("There was a problem with the journal file.\n\n%1")
                .arg(QString::fromStdString(error->message)));
    }

    diario::JournalWindow window(store, configManager);
    window.show();

    spdlog::info("Journal window displayed");

    return app.exec();
}

/**
 * Diario - Test Main
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <cstring>

#include <QApplication>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // PDF fonts and the window tests need an application object; no display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QApplication app(argc, argv);

    // Store and exporter failures are expected in tests; keep output readable
    spdlog::set_level(spdlog::level::critical);
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--log-debug") == 0) {
            spdlog::set_level(spdlog::level::debug);
        }
    }

    return RUN_ALL_TESTS();
}

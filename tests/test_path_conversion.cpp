/**
 * Diario - Path Conversion Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/PathConversion.hpp"
#include "core/config/ConfigManager.hpp"

using diario::displayPath;
using diario::toPath;
using diario::toQString;

TEST(PathConversionTest, NonAsciiNamesSurviveBothDirections) {
    const QString name = QStringLiteral("José/Poesía/diario-ñ.json");

    const std::filesystem::path path = toPath(name);

    EXPECT_EQ(toQString(path), name);
    EXPECT_EQ(path.filename().u16string(), u"diario-ñ.json");
}

TEST(PathConversionTest, DisplayPathIsUtf8) {
    const auto path = toPath(QStringLiteral("José"));

    EXPECT_EQ(displayPath(path), "Jos\xC3\xA9");
}

TEST(PathConversionTest, NonAsciiFileIsReachable) {
    const auto dir = std::filesystem::temp_directory_path()
        / toPath(QStringLiteral("diario-path-test-José"));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const auto file = dir / toPath(QStringLiteral("entrada-ñ.txt"));
    {
        std::ofstream out(file);
        out << "hola";
    }

    EXPECT_TRUE(std::filesystem::exists(toPath(toQString(file))));

    std::filesystem::remove_all(dir);
}

TEST(PathConversionTest, ConfiguredPathsAreDecodedAsUtf8) {
    const auto dir = std::filesystem::temp_directory_path() / "diario-path-config-test";
    std::filesystem::remove_all(dir);

    diario::ConfigManager config;
    ASSERT_TRUE(config.initialize(dir));

    diario::ProgramConfig program;
    program.dataFile = displayPath(dir / toPath(QStringLiteral("José")) / "journal_data.json");
    program.exportDirectory = displayPath(dir / toPath(QStringLiteral("Exportación")));
    ASSERT_TRUE(config.setProgramConfig(program));

    diario::ConfigManager reloaded;
    ASSERT_TRUE(reloaded.initialize(dir));
    EXPECT_EQ(reloaded.dataFilePath(), dir / toPath(QStringLiteral("José")) / "journal_data.json");
    EXPECT_EQ(reloaded.exportDirectoryPath(), dir / toPath(QStringLiteral("Exportación")));

    std::filesystem::remove_all(dir);
}

/**
 * Diario - Entry Exporter Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "export/EntryExporter.hpp"

using diario::EntryExporter;
using diario::ExportErrorCode;
using diario::ExportFormat;
using diario::JournalEntry;

class EntryExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "diario-export-test";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path testDir;
    const QDate date{2024, 1, 31};
    const JournalEntry entry = JournalEntry::create(
        QStringLiteral("Tomé café.\nLlovió."), QStringLiteral("La luna borda silencios de plata."));
};

TEST_F(EntryExporterTest, PicksFormatFromSuffix) {
    EXPECT_EQ(EntryExporter::formatForPath("entry.txt"), ExportFormat::PlainText);
    EXPECT_EQ(EntryExporter::formatForPath("entry.md"), ExportFormat::PlainText);
    EXPECT_EQ(EntryExporter::formatForPath("entry"), ExportFormat::PlainText);
    EXPECT_EQ(EntryExporter::formatForPath("entry.pdf"), ExportFormat::Pdf);
    EXPECT_EQ(EntryExporter::formatForPath("ENTRY.PDF"), ExportFormat::Pdf);
}

TEST_F(EntryExporterTest, SuggestsFileNameFromDate) {
    EXPECT_EQ(EntryExporter::defaultFileName(date), QStringLiteral("diario-2024-01-31.txt"));
}

TEST_F(EntryExporterTest, WritesPlainText) {
    const auto path = testDir / "entry.txt";

    auto error = EntryExporter::exportEntry(path, date, entry);

    ASSERT_FALSE(error.has_value()) << error->message;
    EXPECT_EQ(readFile(path),
        "Journal & Poetry - 2024-01-31\n\n"
        "=== Journal ===\n"
        "Tomé café.\nLlovió."
        "\n\n=== Poetry ===\n"
        "La luna borda silencios de plata.");
}

TEST_F(EntryExporterTest, MarkdownUsesTextLayout) {
    const auto path = testDir / "entry.md";

    ASSERT_FALSE(EntryExporter::exportEntry(path, date, entry).has_value());
    EXPECT_EQ(readFile(path), EntryExporter::formatText(date, entry).toStdString());
}

TEST_F(EntryExporterTest, ReportsUnwritablePath) {
    const auto path = testDir / "missing-dir" / "entry.txt";

    auto error = EntryExporter::exportEntry(path, date, entry);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ExportErrorCode::IoFailure);
}

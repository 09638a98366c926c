/**
 * Diario - Text-only Export Tests
 *
 * Linked against an exporter compiled without PDF support.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>

#include "export/EntryExporter.hpp"

using diario::EntryExporter;
using diario::ExportErrorCode;
using diario::JournalEntry;

class TextOnlyExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "diario-textonly-test";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
    const QDate date{2024, 1, 31};
    const JournalEntry entry = JournalEntry::create(QStringLiteral("diario"), QStringLiteral("poema"));
};

TEST_F(TextOnlyExportTest, PdfIsNotSupported) {
    EXPECT_FALSE(EntryExporter::isPdfSupported());
}

TEST_F(TextOnlyExportTest, PdfExportReportsMissingCapability) {
    const auto path = testDir / "entry.pdf";

    auto error = EntryExporter::exportEntry(path, date, entry);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ExportErrorCode::MissingCapability);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(TextOnlyExportTest, TextExportStillWorks) {
    const auto path = testDir / "entry.txt";

    EXPECT_FALSE(EntryExporter::exportEntry(path, date, entry).has_value());
    EXPECT_TRUE(std::filesystem::exists(path));
}

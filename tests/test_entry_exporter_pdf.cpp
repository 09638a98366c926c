/**
 * Diario - PDF Export Tests
 *
 * Built only when PDF export is compiled in.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>

#include "export/EntryExporter.hpp"

using diario::EntryExporter;
using diario::ExportErrorCode;
using diario::JournalEntry;

class PdfExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "diario-pdf-test";
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

    // Page objects, not the /Pages tree root
    static std::ptrdiff_t countPages(const std::string& pdf) {
        const std::regex page("/Type\\s*/Page[^s]");
        return std::distance(std::sregex_iterator(pdf.begin(), pdf.end(), page),
                             std::sregex_iterator());
    }

    std::filesystem::path testDir;
    const QDate date{2024, 1, 31};
};

TEST_F(PdfExportTest, IsSupportedInThisBuild) {
    EXPECT_TRUE(EntryExporter::isPdfSupported());
}

TEST_F(PdfExportTest, WritesSinglePageDocument) {
    const auto path = testDir / "entry.pdf";
    const auto entry = JournalEntry::create(QStringLiteral("Tomé café."),
                                            QStringLiteral("La luna borda silencios de plata."));

    auto error = EntryExporter::exportEntry(path, date, entry);

    ASSERT_FALSE(error.has_value()) << error->message;
    const std::string pdf = readFile(path);
    ASSERT_GE(pdf.size(), 4u);
    EXPECT_EQ(pdf.substr(0, 4), "%PDF");
    EXPECT_EQ(countPages(pdf), 1);
}

TEST_F(PdfExportTest, LongEntryFlowsOntoMorePages) {
    const auto path = testDir / "long.pdf";
    QStringList lines;
    for (int i = 0; i < 200; ++i) {
        lines << QStringLiteral("Línea %1 del diario").arg(i);
    }
    const auto entry = JournalEntry::create(lines.join('\n'), QStringLiteral("Fin."));

    auto error = EntryExporter::exportEntry(path, date, entry);

    ASSERT_FALSE(error.has_value()) << error->message;
    EXPECT_GT(countPages(readFile(path)), 1);
}

TEST_F(PdfExportTest, UppercaseSuffixSelectsPdf) {
    const auto path = testDir / "ENTRY.PDF";

    ASSERT_FALSE(EntryExporter::exportEntry(path, date, JournalEntry{}).has_value());
    EXPECT_EQ(readFile(path).substr(0, 4), "%PDF");
}

TEST_F(PdfExportTest, ReportsUnwritablePath) {
    const auto path = testDir / "missing-dir" / "entry.pdf";

    auto error = EntryExporter::exportEntry(path, date, JournalEntry{});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ExportErrorCode::IoFailure);
    EXPECT_FALSE(std::filesystem::exists(path));
}

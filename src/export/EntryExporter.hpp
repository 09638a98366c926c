/**
 * Diario - Entry Exporter
 *
 * Writes a single journal entry to a text, Markdown or PDF file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <QDate>
#include <QString>

#include "core/JournalEntry.hpp"

namespace diario {

enum class ExportFormat {
    PlainText,  // .txt, .md and anything that is not .pdf
    Pdf
};

enum class ExportErrorCode {
    MissingCapability,  // Format not compiled into this build
    IoFailure
};

struct ExportError {
    ExportErrorCode code;
    std::string message;
};

/**
 * Exports entries without touching the store
 */
class EntryExporter {
public:
    /**
     * Pick the output format from the file suffix (case-insensitive)
     */
    static ExportFormat formatForPath(const std::filesystem::path& path);

    /**
     * Whether this build can render PDF documents
     */
    static bool isPdfSupported();

    /**
     * Suggested file name, e.g. "diario-2024-01-31.txt"
     */
    static QString defaultFileName(const QDate& date);

    /**
     * Plain text body shared by the .txt and .md exports
     */
    static QString formatText(const QDate& date, const JournalEntry& entry);

    /**
     * Write the entry to path in the format implied by its suffix
     */
    static std::optional<ExportError> exportEntry(const std::filesystem::path& path,
                                                  const QDate& date,
                                                  const JournalEntry& entry);

private:
    static std::optional<ExportError> exportToText(const std::filesystem::path& path,
                                                   const QDate& date,
                                                   const JournalEntry& entry);
    static std::optional<ExportError> exportToPdf(const std::filesystem::path& path,
                                                  const QDate& date,
                                                  const JournalEntry& entry);
};

} // namespace diario

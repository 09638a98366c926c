/**
 * Diario - Entry Exporter Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "EntryExporter.hpp"
#include "core/PathConversion.hpp"

#include <QFileInfo>
#include <QSaveFile>
#include <QStringList>

#ifdef DIARIO_ENABLE_PDF_EXPORT
#include <QFont>
#include <QFontMetrics>
#include <QMarginsF>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#endif

#include <spdlog/spdlog.h>

namespace diario {

namespace {

#ifdef DIARIO_ENABLE_PDF_EXPORT
// Layout in points; the writer runs at 72 dpi so one point is one pixel
constexpr int PDF_RESOLUTION = 72;
constexpr int PDF_MARGIN = 72;
constexpr int PDF_TITLE_SIZE = 16;
constexpr int PDF_BODY_SIZE = 12;
constexpr int PDF_BODY_OFFSET = 36;
#endif

} // anonymous namespace

ExportFormat EntryExporter::formatForPath(const std::filesystem::path& path) {
    const QString suffix = QFileInfo(toQString(path)).suffix().toLower();
    return suffix == QStringLiteral("pdf") ? ExportFormat::Pdf : ExportFormat::PlainText;
}

bool EntryExporter::isPdfSupported() {
#ifdef DIARIO_ENABLE_PDF_EXPORT
    return true;
#else
    return false;
#endif
}

QString EntryExporter::defaultFileName(const QDate& date) {
    return QStringLiteral("diario-%1.txt").arg(date.toString(Qt::ISODate));
}

QString EntryExporter::formatText(const QDate& date, const JournalEntry& entry) {
    QString text;
    text += QStringLiteral("Journal & Poetry - %1\n\n").arg(date.toString(Qt::ISODate));
    text += QStringLiteral("=== Journal ===\n");
    text += entry.journal;
    text += QStringLiteral("\n\n=== Poetry ===\n");
    text += entry.poetry;
    return text;
}

std::optional<ExportError> EntryExporter::exportEntry(const std::filesystem::path& path,
                                                      const QDate& date,
                                                      const JournalEntry& entry) {
    auto error = formatForPath(path) == ExportFormat::Pdf
        ? exportToPdf(path, date, entry)
        : exportToText(path, date, entry);

    if (error) {
        spdlog::error("Export of {} failed: {}", date.toString(Qt::ISODate).toStdString(), error->message);
    } else {
        spdlog::info("Exported {} to: {}", date.toString(Qt::ISODate).toStdString(), displayPath(path));
    }
    return error;
}

std::optional<ExportError> EntryExporter::exportToText(const std::filesystem::path& path,
                                                       const QDate& date,
                                                       const JournalEntry& entry) {
    const QByteArray payload = formatText(date, entry).toUtf8();

    QSaveFile file(toQString(path));
    if (!file.open(QIODevice::WriteOnly)) {
        return ExportError{ExportErrorCode::IoFailure,
            "Cannot open " + displayPath(path) + ": " + file.errorString().toStdString()};
    }
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        return ExportError{ExportErrorCode::IoFailure,
            "Cannot write " + displayPath(path) + ": " + file.errorString().toStdString()};
    }
    if (!file.commit()) {
        return ExportError{ExportErrorCode::IoFailure,
            "Cannot write " + displayPath(path) + ": " + file.errorString().toStdString()};
    }
    return std::nullopt;
}

#ifdef DIARIO_ENABLE_PDF_EXPORT

std::optional<ExportError> EntryExporter::exportToPdf(const std::filesystem::path& path,
                                                      const QDate& date,
                                                      const JournalEntry& entry) {
    const QString key = date.toString(Qt::ISODate);

    QPdfWriter writer(toQString(path));
    writer.setPageSize(QPageSize(QPageSize::Letter));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setResolution(PDF_RESOLUTION);
    writer.setTitle(QStringLiteral("Diario %1").arg(key));

    QPainter painter;
    if (!painter.begin(&writer)) {
        return ExportError{ExportErrorCode::IoFailure, "Cannot create PDF document: " + displayPath(path)};
    }

    const int bottom = writer.height() - PDF_MARGIN;

    QFont titleFont(QStringLiteral("Times"));
    titleFont.setPointSize(PDF_TITLE_SIZE);
    painter.setFont(titleFont);
    painter.drawText(PDF_MARGIN, PDF_MARGIN, QStringLiteral("Entry for %1").arg(key));

    QFont bodyFont(QStringLiteral("Times"));
    bodyFont.setPointSize(PDF_BODY_SIZE);
    painter.setFont(bodyFont);
    const int lineHeight = QFontMetrics(bodyFont, &writer).lineSpacing();

    QStringList lines;
    lines << QStringLiteral("=== Journal ===");
    lines << entry.journal.split('\n');
    lines << QString();
    lines << QStringLiteral("=== Poetry ===");
    lines << entry.poetry.split('\n');

    int y = PDF_MARGIN + PDF_BODY_OFFSET;
    for (const QString& line : lines) {
        if (y > bottom) {
            if (!writer.newPage()) {
                painter.end();
                return ExportError{ExportErrorCode::IoFailure, "Cannot add PDF page: " + displayPath(path)};
            }
            y = PDF_MARGIN;
        }
        painter.drawText(PDF_MARGIN, y, line);
        y += lineHeight;
    }

    if (!painter.end()) {
        return ExportError{ExportErrorCode::IoFailure, "Cannot finish PDF document: " + displayPath(path)};
    }
    return std::nullopt;
}

#else

std::optional<ExportError> EntryExporter::exportToPdf(const std::filesystem::path& path,
                                                      const QDate&,
                                                      const JournalEntry&) {
    return ExportError{ExportErrorCode::MissingCapability,
        "PDF export is not available in this build, cannot write " + displayPath(path)};
}

#endif // DIARIO_ENABLE_PDF_EXPORT

} // namespace diario

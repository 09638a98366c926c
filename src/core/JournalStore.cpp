/**
 * Diario - Journal Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "JournalStore.hpp"
#include "PathConversion.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include <spdlog/spdlog.h>

namespace diario {

namespace {

constexpr const char* CORRUPT_SUFFIX = ".corrupt";
constexpr int MAX_CORRUPT_BACKUPS = 1000;

std::string isoKey(const QDate& date) {
    return date.toString(Qt::ISODate).toStdString();
}

} // anonymous namespace

const char* storeErrorCodeToString(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::CorruptData:
            return "corrupt data";
        case StoreErrorCode::IoFailure:
            return "I/O failure";
        case StoreErrorCode::InvalidDate:
            return "invalid date";
    }
    return "unknown";
}

JournalStore::JournalStore(std::filesystem::path dataFile,
                           std::unique_ptr<RandomSource> random,
                           QDate startDate)
    : m_dataFile(std::move(dataFile))
    , m_generator(std::move(random))
    , m_startDate(startDate)
{
}

std::optional<StoreError> JournalStore::load(const QDate& today) {
    m_entries.clear();

    auto loadError = readFile();
    bool fileReplaceable = true;
    if (loadError) {
        m_entries.clear();
        spdlog::warn("Starting with an empty journal: {}", loadError->message);
        // Do not replace a file we could not read or could not back up
        fileReplaceable = loadError->code == StoreErrorCode::CorruptData && preserveCorruptFile();
    }

    bool changed = loadError.has_value();
    if (backfill(today) > 0) {
        changed = true;
    }
    // Backfill already covers today unless it is before the start date
    if (isStorableDate(today) && m_entries.try_emplace(today).second) {
        changed = true;
    }

    spdlog::info("Loaded {} journal entries from: {}", m_entries.size(), displayPath(m_dataFile));

    // Nothing to persist when the file already held everything
    if (!changed) {
        return std::nullopt;
    }
    if (!fileReplaceable) {
        return loadError;
    }

    auto saveError = save();
    return loadError ? loadError : saveError;
}

std::optional<StoreError> JournalStore::ensureBackfilled(const QDate& today) {
    if (backfill(today) == 0) {
        return std::nullopt;
    }
    return save();
}

std::optional<StoreError> JournalStore::save() {
    const QString path = toQString(m_dataFile);

    QFileInfo fileInfo(path);
    if (!QDir().mkpath(fileInfo.absolutePath())) {
        std::string message = "Failed to create directory for journal file: "
            + fileInfo.absolutePath().toStdString();
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::IoFailure, message};
    }

    QJsonObject root;
    for (const auto& [date, entry] : m_entries) {
        root.insert(date.toString(Qt::ISODate), entry.toJson());
    }
    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);

    // QSaveFile writes a temporary file and renames it over the target on
    // commit, so the old file survives any failure
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        std::string message = "Failed to open journal file for writing: " + displayPath(m_dataFile)
            + " (" + file.errorString().toStdString() + ")";
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::IoFailure, message};
    }

    if (file.write(payload) != payload.size()) {
        std::string message = "Failed to write journal file: " + displayPath(m_dataFile)
            + " (" + file.errorString().toStdString() + ")";
        spdlog::error("{}", message);
        file.cancelWriting();
        return StoreError{StoreErrorCode::IoFailure, message};
    }

    if (!file.commit()) {
        std::string message = "Failed to commit journal file: " + displayPath(m_dataFile)
            + " (" + file.errorString().toStdString() + ")";
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::IoFailure, message};
    }

    spdlog::debug("Saved {} journal entries to: {}", m_entries.size(), displayPath(m_dataFile));
    return std::nullopt;
}

bool JournalStore::isStorableDate(const QDate& date) {
    if (!date.isValid()) {
        return false;
    }
    const QString key = date.toString(Qt::ISODate);
    return !key.isEmpty() && QDate::fromString(key, Qt::ISODate) == date;
}

std::optional<JournalEntry> JournalStore::get(const QDate& date) {
    if (!isStorableDate(date)) {
        spdlog::warn("Ignoring request for unstorable date: {}", date.toJulianDay());
        return std::nullopt;
    }
    return m_entries[date];
}

std::optional<StoreError> JournalStore::put(const QDate& date, const JournalEntry& entry) {
    if (!isStorableDate(date)) {
        std::string message = "Cannot store an entry for a date without an ISO form (julian day "
            + std::to_string(date.toJulianDay()) + ")";
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::InvalidDate, message};
    }

    m_entries[date] = JournalEntry::create(entry.journal, entry.poetry);
    spdlog::debug("Updated journal entry: {}", isoKey(date));
    return std::nullopt;
}

std::vector<QDate> JournalStore::listDates() const {
    std::vector<QDate> dates;
    dates.reserve(m_entries.size());
    for (const auto& [date, entry] : m_entries) {
        dates.push_back(date);
    }
    return dates;
}

bool JournalStore::contains(const QDate& date) const {
    return m_entries.find(date) != m_entries.end();
}

std::optional<StoreError> JournalStore::readFile() {
    const QString path = toQString(m_dataFile);
    QFile file(path);

    if (!file.exists()) {
        spdlog::debug("No journal file found at: {}", displayPath(m_dataFile));
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        std::string message = "Failed to open journal file: " + displayPath(m_dataFile)
            + " (" + file.errorString().toStdString() + ")";
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::IoFailure, message};
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        std::string message = "Invalid journal file " + displayPath(m_dataFile) + ": "
            + parseError.errorString().toStdString()
            + " at offset " + std::to_string(parseError.offset);
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::CorruptData, message};
    }

    if (!doc.isObject()) {
        std::string message = "Invalid journal file format, expected an object: " + displayPath(m_dataFile);
        spdlog::error("{}", message);
        return StoreError{StoreErrorCode::CorruptData, message};
    }

    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        const QString key = it.key();
        const QDate date = QDate::fromString(key, Qt::ISODate);
        if (!date.isValid() || date.toString(Qt::ISODate) != key) {
            std::string message = "Invalid date key in journal file: " + key.toStdString();
            spdlog::error("{}", message);
            return StoreError{StoreErrorCode::CorruptData, message};
        }

        auto entry = JournalEntry::fromJson(it.value());
        if (!entry) {
            std::string message = "Invalid journal entry for " + key.toStdString()
                + ": expected string \"journal\" and \"poetry\" fields";
            spdlog::error("{}", message);
            return StoreError{StoreErrorCode::CorruptData, message};
        }

        m_entries[date] = *entry;
    }

    return std::nullopt;
}

std::size_t JournalStore::backfill(const QDate& today) {
    if (!isStorableDate(today) || !isStorableDate(m_startDate)) {
        spdlog::warn("Skipping backfill, invalid date range");
        return 0;
    }

    std::size_t added = 0;
    for (QDate date = m_startDate; date <= today; date = date.addDays(1)) {
        if (contains(date)) {
            continue;
        }
        JournalEntry entry;
        entry.journal = m_generator.generate(SampleCategory::Journal);
        entry.poetry = m_generator.generate(SampleCategory::Poetry);
        m_entries.emplace(date, std::move(entry));
        ++added;
    }

    if (added > 0) {
        spdlog::info("Backfilled {} journal entries between {} and {}",
                     added, isoKey(m_startDate), isoKey(today));
    }
    return added;
}

bool JournalStore::preserveCorruptFile() const {
    const QString path = toQString(m_dataFile);

    // Earlier backups are never replaced: .corrupt, .corrupt.1, .corrupt.2, ...
    QString backup = path + CORRUPT_SUFFIX;
    for (int n = 1; QFileInfo::exists(backup); ++n) {
        if (n > MAX_CORRUPT_BACKUPS) {
            spdlog::error("Too many corrupt journal backups beside: {}", displayPath(m_dataFile));
            return false;
        }
        backup = path + CORRUPT_SUFFIX + '.' + QString::number(n);
    }

    if (!QFile::copy(path, backup)) {
        spdlog::error("Failed to keep a copy of the corrupt journal file: {}", displayPath(m_dataFile));
        return false;
    }

    spdlog::warn("Kept corrupt journal file as: {}", backup.toStdString());
    return true;
}

} // namespace diario

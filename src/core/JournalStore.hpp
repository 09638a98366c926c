/**
 * Diario - Journal Store
 *
 * Owns every journal entry, keyed by date, and its backing JSON file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "JournalEntry.hpp"
#include "SampleTextGenerator.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QDate>

namespace diario {

enum class StoreErrorCode {
    CorruptData,    // Backing file exists but is not a date -> entry mapping
    IoFailure,      // Backing file could not be read or written
    InvalidDate     // Date has no YYYY-MM-DD form and cannot be a key
};

struct StoreError {
    StoreErrorCode code;
    std::string message;
};

const char* storeErrorCodeToString(StoreErrorCode code);

/**
 * Date-indexed journal entries with persistence to a single JSON file
 *
 * After load() or ensureBackfilled() every date from startDate() through the
 * supplied "today" has an entry. Missing historical dates are filled with
 * generated placeholder text; existing entries are never touched.
 *
 * The file looks like:
 *   { "2024-01-01": { "journal": "...", "poetry": "..." }, ... }
 *
 * Errors are returned, never thrown. The in-memory mapping stays
 * authoritative when the file cannot be written.
 */
class JournalStore {
public:
    /**
     * First date that backfill covers
     */
    static QDate defaultStartDate() { return QDate(2024, 1, 1); }

    explicit JournalStore(std::filesystem::path dataFile,
                          std::unique_ptr<RandomSource> random = RandomSource::create(),
                          QDate startDate = defaultStartDate());

    JournalStore(const JournalStore&) = delete;
    JournalStore& operator=(const JournalStore&) = delete;

    /**
     * Load entries from disk, then make sure today and every date since
     * startDate() exist and persist the result
     *
     * A corrupt file resets the store to empty and is copied beside the data
     * file as ".corrupt" (or ".corrupt.N" when earlier copies exist) before
     * it is replaced. An unreadable file, or one that could not be copied,
     * is left alone.
     */
    std::optional<StoreError> load(const QDate& today);

    /**
     * Fill every missing date in [startDate(), today] and save if anything
     * was added
     */
    std::optional<StoreError> ensureBackfilled(const QDate& today);

    /**
     * Atomically write all entries to the backing file
     */
    std::optional<StoreError> save();

    /**
     * Whether a date can be used as a key: valid, with a year in 1-9999
     */
    static bool isStorableDate(const QDate& date);

    /**
     * Get the entry for a date, creating an empty one if needed
     *
     * Returns nullopt, without creating anything, for unstorable dates.
     */
    std::optional<JournalEntry> get(const QDate& date);

    /**
     * Replace the entry for a date. Trailing whitespace is trimmed.
     */
    std::optional<StoreError> put(const QDate& date, const JournalEntry& entry);

    /**
     * All dates with an entry, oldest first
     */
    std::vector<QDate> listDates() const;

    bool contains(const QDate& date) const;
    std::size_t size() const { return m_entries.size(); }
    const std::map<QDate, JournalEntry>& entries() const { return m_entries; }

    const std::filesystem::path& filePath() const { return m_dataFile; }
    QDate startDate() const { return m_startDate; }

private:
    std::optional<StoreError> readFile();
    std::size_t backfill(const QDate& today);
    bool preserveCorruptFile() const;

    std::filesystem::path m_dataFile;
    SampleTextGenerator m_generator;
    QDate m_startDate;
    std::map<QDate, JournalEntry> m_entries;
};

} // namespace diario

/**
 * Diario - Journal Entry
 *
 * Data model for one day of the journal.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace diario {

/**
 * The journal and poetry text written for a single calendar date
 *
 * An entry has no identity of its own; it is keyed by its date in the
 * JournalStore. Writes always replace both fields together.
 */
struct JournalEntry {
    QString journal;
    QString poetry;

    /**
     * Create an entry with trailing whitespace removed from both fields
     */
    static JournalEntry create(const QString& journal, const QString& poetry) {
        JournalEntry entry;
        entry.journal = trimTrailing(journal);
        entry.poetry = trimTrailing(poetry);
        return entry;
    }

    bool isEmpty() const {
        return journal.isEmpty() && poetry.isEmpty();
    }

    /**
     * Serialize to JSON
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["journal"] = journal;
        obj["poetry"] = poetry;
        return obj;
    }

    /**
     * Deserialize from JSON
     *
     * Returns nullopt unless the value is an object holding string
     * "journal" and "poetry" fields.
     */
    static std::optional<JournalEntry> fromJson(const QJsonValue& value) {
        if (!value.isObject()) {
            return std::nullopt;
        }

        const QJsonObject obj = value.toObject();
        const QJsonValue journal = obj.value("journal");
        const QJsonValue poetry = obj.value("poetry");
        if (!journal.isString() || !poetry.isString()) {
            return std::nullopt;
        }

        JournalEntry entry;
        entry.journal = journal.toString();
        entry.poetry = poetry.toString();
        return entry;
    }

    static QString trimTrailing(QString text) {
        while (!text.isEmpty() && text.back().isSpace()) {
            text.chop(1);
        }
        return text;
    }

    bool operator==(const JournalEntry& other) const = default;
};

} // namespace diario

/**
 * Diario - Sample Text Generator
 *
 * Placeholder text for days the user never wrote about.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <QString>
#include <QStringList>

#include "RandomSource.hpp"

namespace diario {

/**
 * Kind of placeholder text
 */
enum class SampleCategory {
    Journal,
    Poetry
};

/**
 * Thrown when text is requested for a category that does not exist
 */
class InvalidCategory : public std::invalid_argument {
public:
    explicit InvalidCategory(const std::string& category);

    const std::string& category() const { return m_category; }

private:
    std::string m_category;
};

std::optional<SampleCategory> categoryFromString(std::string_view name);
const char* categoryToString(SampleCategory category);

/**
 * Builds placeholder text from a fixed set of Spanish sentences
 *
 * Each call picks a line count in [kMinLines, kMaxLines] and then draws
 * that many sentences, with replacement, from the category's set.
 */
class SampleTextGenerator {
public:
    static constexpr int kMinLines = 3;
    static constexpr int kMaxLines = 6;

    explicit SampleTextGenerator(std::unique_ptr<RandomSource> random = RandomSource::create());

    QString generate(SampleCategory category);

    /**
     * Generate text for a category given by name ("journal" or "poetry")
     *
     * @throws InvalidCategory for any other name
     */
    QString generate(const std::string& category);

    /**
     * Candidate sentences for a category
     */
    static const QStringList& fragments(SampleCategory category);

private:
    std::unique_ptr<RandomSource> m_random;
};

} // namespace diario

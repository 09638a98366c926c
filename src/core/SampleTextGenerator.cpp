/**
 * Diario - Sample Text Generator Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SampleTextGenerator.hpp"

#include <spdlog/spdlog.h>

namespace diario {

namespace {

const QStringList& journalFragments() {
    static const QStringList fragments = {
        QStringLiteral("El cielo estaba cubierto de nubes suaves."),
        QStringLiteral("Tomé una taza de café mirando por la ventana."),
        QStringLiteral("Anoté las ideas que surgieron en la madrugada."),
        QStringLiteral("Encontré un momento de calma en medio del ruido."),
        QStringLiteral("La caminata corta me ayudó a aclarar la mente."),
        QStringLiteral("Un nuevo proyecto comenzó a tomar forma hoy."),
        QStringLiteral("Me acompañó la música mientras escribía."),
        QStringLiteral("Decidí enfocarme en agradecer las pequeñas cosas."),
        QStringLiteral("Guardé este pensamiento para revisarlo más tarde."),
        QStringLiteral("Terminó el día con una sonrisa silenciosa."),
    };
    return fragments;
}

const QStringList& poetryFragments() {
    static const QStringList fragments = {
        QStringLiteral("Brilla la tarde sobre el rincón del eco."),
        QStringLiteral("La luna borda silencios de plata."),
        QStringLiteral("Un río de suspiros cruza la memoria."),
        QStringLiteral("Las palabras germinan bajo la lluvia lenta."),
        QStringLiteral("En el pecho crece un jardín de luciérnagas."),
        QStringLiteral("Danza el viento con las hojas dormidas."),
        QStringLiteral("Se despierta el verso con aroma a madrugada."),
        QStringLiteral("La sombra canta a la luz que no termina."),
        QStringLiteral("Cada latido sostiene un puente de espuma."),
        QStringLiteral("El poema sueña con voces de agua clara."),
    };
    return fragments;
}

} // anonymous namespace

InvalidCategory::InvalidCategory(const std::string& category)
    : std::invalid_argument("Unknown sample text category: " + category)
    , m_category(category)
{
}

std::optional<SampleCategory> categoryFromString(std::string_view name) {
    if (name == "journal") return SampleCategory::Journal;
    if (name == "poetry") return SampleCategory::Poetry;
    return std::nullopt;
}

const char* categoryToString(SampleCategory category) {
    switch (category) {
        case SampleCategory::Journal:
            return "journal";
        case SampleCategory::Poetry:
            return "poetry";
    }
    return "journal";
}

SampleTextGenerator::SampleTextGenerator(std::unique_ptr<RandomSource> random)
    : m_random(std::move(random))
{
    if (!m_random) {
        m_random = RandomSource::create();
    }
}

const QStringList& SampleTextGenerator::fragments(SampleCategory category) {
    switch (category) {
        case SampleCategory::Journal:
            return journalFragments();
        case SampleCategory::Poetry:
            return poetryFragments();
    }
    return journalFragments();
}

QString SampleTextGenerator::generate(SampleCategory category) {
    const QStringList& candidates = fragments(category);
    const int lineCount = m_random->uniformInt(kMinLines, kMaxLines);

    QStringList lines;
    lines.reserve(lineCount);
    for (int i = 0; i < lineCount; ++i) {
        lines.append(candidates.at(m_random->uniformInt(0, static_cast<int>(candidates.size()) - 1)));
    }
    return lines.join('\n');
}

QString SampleTextGenerator::generate(const std::string& category) {
    auto parsed = categoryFromString(category);
    if (!parsed) {
        spdlog::error("Sample text requested for unknown category: {}", category);
        throw InvalidCategory(category);
    }
    return generate(*parsed);
}

} // namespace diario

/**
 * Diario - Random Source Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RandomSource.hpp"

#include <QRandomGenerator>

namespace diario {

namespace {

class GlobalRandomSource : public RandomSource {
public:
    int uniformInt(int low, int high) override {
        // bounded() excludes the upper bound
        return QRandomGenerator::global()->bounded(low, high + 1);
    }
};

class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint32_t seed)
        : m_generator(seed)
    {
    }

    int uniformInt(int low, int high) override {
        return m_generator.bounded(low, high + 1);
    }

private:
    QRandomGenerator m_generator;
};

} // anonymous namespace

std::unique_ptr<RandomSource> RandomSource::create() {
    return std::make_unique<GlobalRandomSource>();
}

std::unique_ptr<RandomSource> RandomSource::createSeeded(std::uint32_t seed) {
    return std::make_unique<SeededRandomSource>(seed);
}

} // namespace diario

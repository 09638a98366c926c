/**
 * Diario - Random Source
 *
 * Source of randomness for placeholder text generation.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <memory>

namespace diario {

/**
 * Abstract random number source
 *
 * Implementations:
 * - GlobalRandomSource: process-wide QRandomGenerator, securely seeded
 * - SeededRandomSource: reproducible sequence from a fixed seed
 *
 * Tests provide their own implementation to script exact values.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * Draw a uniformly distributed integer
     *
     * @param low Smallest value that may be returned
     * @param high Largest value that may be returned (inclusive)
     */
    virtual int uniformInt(int low, int high) = 0;

    /**
     * Get the process-wide random source
     */
    static std::unique_ptr<RandomSource> create();

    /**
     * Get a source that repeats the same sequence for the same seed
     */
    static std::unique_ptr<RandomSource> createSeeded(std::uint32_t seed);

protected:
    RandomSource() = default;
};

} // namespace diario

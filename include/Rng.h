/**
 * @file Rng.h
 * @brief Seeded PRNG owned by the simulation; identical seeds give identical rain.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

class Rng {
public:
    explicit Rng(uint32_t seed) : prng(seed) {}

    void reseed(uint32_t seed) {
        prng.seed(seed);
        unit.reset();
    }

    /** @brief Uniform real in [0,1). Draws that round up to 1 are pulled back inside the range. */
    float rand01() {
        float r = unit(prng);
        if (!(r >= 0.0f)) return 0.0f;
        return r < 1.0f ? r : std::nextafter(1.0f, 0.0f);
    }
    /** @brief Uniform real in [lo,hi). */
    float range(float lo, float hi) { return lo + (hi - lo) * rand01(); }
    /** @brief Uniform integer in [lo,hi]. */
    int randInt(int lo, int hi) {
        std::uniform_int_distribution<int> d(lo, hi);
        return d(prng);
    }
    /** @brief True with probability @p p. */
    bool chance(float p) { return rand01() < p; }

    std::mt19937& engine() { return prng; }

private:
    std::mt19937 prng;
    std::uniform_real_distribution<float> unit{0.0f, 1.0f};
};

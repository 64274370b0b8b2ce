/**
 * @file Random.hpp
 * @brief Seeded pseudo-random source for spawning and splitting.
 *
 * All gameplay randomness goes through one Random instance owned by the
 * caller so that a run is reproducible from its seed.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_MATH_RANDOM_HPP
    #define ASTRO_MATH_RANDOM_HPP

    #include <astro/core/Types.hpp>

    #include <random>

namespace astro::math {

class Random final {
public:
    explicit Random(core::u64 seed = 0);

    /** @brief Uniform real in [lo, hi]. */
    [[nodiscard]] core::f32 uniform(core::f32 lo, core::f32 hi);

    /** @brief Uniform integer in [lo, hi] (inclusive). */
    [[nodiscard]] core::i32 uniformInt(core::i32 lo, core::i32 hi);

    void reseed(core::u64 seed);

private:
    std::mt19937_64 _engine;
};

} // namespace astro::math

#endif // ASTRO_MATH_RANDOM_HPP

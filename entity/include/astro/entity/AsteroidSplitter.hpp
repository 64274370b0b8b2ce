/**
 * @file AsteroidSplitter.hpp
 * @brief Replaces a destroyed asteroid by two smaller fragments.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_ASTEROID_SPLITTER_HPP
    #define ASTRO_ENTITY_ASTEROID_SPLITTER_HPP

    #include "Asteroid.hpp"
    #include "Lifecycle.hpp"

    #include <astro/math/Random.hpp>

    #include <vector>

namespace astro::entity {

struct SplitConfig
{
    core::f32 minRadius{core::kAsteroidMinRadius};
    core::f32 speedScale{core::kSplitSpeedScale};
    core::f32 minAngleDeg{core::kSplitMinAngleDeg};
    core::f32 maxAngleDeg{core::kSplitMaxAngleDeg};
};

class AsteroidSplitter final {
public:
    using AsteroidRef = Lifecycle<Asteroid>::Acquired;

    explicit AsteroidSplitter(Lifecycle<Asteroid> &lifecycle, SplitConfig config = {}) noexcept;

    /**
     * @brief Retires @p parent and spawns its fragments.
     *
     * Position, velocity, radius and metadata are captured before the
     * parent is released: with a LIFO pool the first fragment is very
     * likely the very same instance.  A parent at or below the minimum
     * radius leaves no fragments; otherwise two fragments of radius
     * `radius - minRadius` are spawned with the parent velocity rotated by
     * +a and -a degrees (a uniform in [minAngleDeg, maxAngleDeg]) and
     * scaled by speedScale.  A parent that is no longer current (already
     * released, possibly recycled since) is left untouched.
     *
     * @return The fragments (0 or 2), or the lifecycle's error.
     */
    [[nodiscard]] core::Expected<std::vector<AsteroidRef>> split(const AsteroidRef &parent, math::Random &rng);

    [[nodiscard]] const SplitConfig &config() const noexcept { return _config; }

private:
    Lifecycle<Asteroid> &_lifecycle;
    SplitConfig          _config;
};

} // namespace astro::entity

#endif // ASTRO_ENTITY_ASTEROID_SPLITTER_HPP

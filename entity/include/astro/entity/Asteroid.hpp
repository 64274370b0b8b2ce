/**
 * @file Asteroid.hpp
 * @brief Drifting debris body; splits into two smaller fragments when shot.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_ASTEROID_HPP
    #define ASTRO_ENTITY_ASTEROID_HPP

    #include "DebrisMetadata.hpp"

    #include <astro/physics/CircleBody.hpp>
    #include <astro/core/Constants.hpp>

namespace astro::entity {

class Asteroid final : public physics::CircleBody {
public:
    static constexpr physics::BodyKind kKind = physics::BodyKind::kAsteroid;

    struct Params
    {
        math::Vec2f    position{};
        core::f32      radius{core::kAsteroidMinRadius};
        DebrisMetadata metadata{};
    };

    explicit Asteroid(const Params &params);

    /**
     * @brief Reinitialises every field from @p params.
     *
     * Velocity is zeroed, the asteroid is alive again and its scan flags
     * are cleared, whatever state the previous user left behind.
     */
    void reset(const Params &params);

    void update(core::f32 dt) noexcept { advance(dt); }

    [[nodiscard]] const DebrisMetadata &metadata() const noexcept { return _metadata; }

    [[nodiscard]] bool isScanned()      const noexcept { return _scanned; }
    [[nodiscard]] bool isFullyScanned() const noexcept { return _fullyScanned; }

    /** @brief Records that a scanner reached this asteroid (@p full: scanned to completion). */
    void markScanned(bool full) noexcept;

private:
    DebrisMetadata _metadata;
    bool           _scanned{false};
    bool           _fullyScanned{false};
};

} // namespace astro::entity

#endif // ASTRO_ENTITY_ASTEROID_HPP

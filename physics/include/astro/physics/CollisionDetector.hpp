/**
 * @file CollisionDetector.hpp
 * @brief Narrow-phase collision detection for circles.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_PHYSICS_COLLISIONDETECTOR_HPP
    #define ASTRO_PHYSICS_COLLISIONDETECTOR_HPP

#include <astro/math/Vec2.hpp>
#include <astro/core/Types.hpp>

namespace astro::physics {

/**
 * @struct CollisionResult
 * @brief Result of a narrow-phase test between two circles.
 */
struct CollisionResult
{
    bool        colliding{false};
    math::Vec2f normal{};            ///< Unit vector from A towards B.
    core::f32   penetrationDepth{0}; ///< rA + rB - distance (>= 0 when colliding).
};

/**
 * @class CollisionDetector
 * @brief Stateless narrow-phase query functions.
 */
class CollisionDetector
{
public:
    CollisionDetector() = delete;

    /**
     * @brief Circle vs circle overlap test.
     * @param centerA Centre of circle A.
     * @param radiusA Radius of circle A.
     * @param centerB Centre of circle B.
     * @param radiusB Radius of circle B.
     * @return Colliding when distance <= radiusA + radiusB.
     */
    [[nodiscard]] static CollisionResult testCircleVsCircle(
        math::Vec2f centerA, core::f32 radiusA,
        math::Vec2f centerB, core::f32 radiusB) noexcept;
};

} // namespace astro::physics

#endif // ASTRO_PHYSICS_COLLISIONDETECTOR_HPP

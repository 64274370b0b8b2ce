/**
 * @file CollisionDetector.cpp
 * @brief Narrow-phase collision detection implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/physics/CollisionDetector.hpp>

#include <cmath>

namespace astro::physics {

CollisionResult CollisionDetector::testCircleVsCircle(
    math::Vec2f centerA, core::f32 radiusA,
    math::Vec2f centerB, core::f32 radiusB) noexcept
{
    CollisionResult result{};

    const auto diff = centerB - centerA;
    const auto distSq = diff.lengthSquared();
    const auto radSum = radiusA + radiusB;

    if (distSq > radSum * radSum)
    {
        return result;
    }

    const auto dist = std::sqrt(distSq);

    result.colliding = true;
    result.normal = dist > 0.0f ? diff / dist : math::Vec2f::unitX();
    result.penetrationDepth = radSum - dist;

    return result;
}

} // namespace astro::physics

/**
 * @file CircleBody.cpp
 * @brief CircleBody implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/physics/CircleBody.hpp>
#include <astro/physics/CollisionDetector.hpp>

#include <algorithm>

namespace astro::physics {

std::string_view bodyKindName(BodyKind kind) noexcept
{
    switch (kind)
    {
        case BodyKind::kAsteroid: return "asteroid";
        case BodyKind::kShot:     return "shot";
        case BodyKind::kPlayer:   return "player";
    }
    return "unknown";
}

CircleBody::CircleBody(BodyKind kind, math::Vec2f position, core::f32 radius) noexcept
    : _position{position}
    , _radius{std::max(radius, 0.0f)}
    , _kind{kind}
{}

void CircleBody::advance(core::f32 dt) noexcept
{
    if (!_alive)
    {
        return;
    }
    _position += _velocity * dt;
}

bool CircleBody::collidesWith(const CircleBody &other) const noexcept
{
    return CollisionDetector::testCircleVsCircle(_position, _radius,
                                                 other._position, other._radius).colliding;
}

} // namespace astro::physics

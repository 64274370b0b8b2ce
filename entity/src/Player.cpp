/**
 * @file Player.cpp
 * @brief Player implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/entity/Player.hpp>

#include <cmath>

namespace astro::entity {

Player::Player(math::Vec2f position, core::f32 radius) noexcept
    : CircleBody{kKind, position, radius}
{}

math::Vec2f Player::forward() const noexcept
{
    return math::Vec2f::unitY().rotated(_rotation);
}

void Player::turn(core::f32 degreesPerSecond, core::f32 dt) noexcept
{
    _rotation = std::fmod(_rotation + degreesPerSecond * dt, 360.0f);
}

void Player::thrust(core::f32 speed, core::f32 dt) noexcept
{
    if (!_alive)
        return;
    _position += forward() * (speed * dt);
}

void Player::tickCooldown(core::f32 dt) noexcept
{
    _shootTimer -= dt;
    if (_shootTimer < 0.0f)
        _shootTimer = 0.0f;
}

bool Player::tryFire(core::f32 cooldown) noexcept
{
    if (!_alive || _shootTimer > 0.0f)
        return false;
    _shootTimer = cooldown;
    return true;
}

void Player::respawn(math::Vec2f position) noexcept
{
    _position   = position;
    _velocity   = math::Vec2f::zero();
    _rotation   = 0.0f;
    _shootTimer = 0.0f;
    _alive      = true;
}

} // namespace astro::entity

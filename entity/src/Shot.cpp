/**
 * @file Shot.cpp
 * @brief Shot implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/entity/Shot.hpp>

#include <algorithm>

namespace astro::entity {

Shot::Shot(const Params &params)
    : CircleBody{kKind, params.position, params.radius}
    , _maxLifetime{params.maxLifetime}
{}

void Shot::reset(const Params &params)
{
    _position    = params.position;
    _velocity    = math::Vec2f::zero();
    _radius      = std::max(params.radius, 0.0f);
    _alive       = true;
    _lifetime    = 0.0f;
    _maxLifetime = params.maxLifetime;
}

void Shot::update(core::f32 dt) noexcept
{
    if (!_alive)
        return;
    advance(dt);
    _lifetime += dt;
}

} // namespace astro::entity

/**
 * @file Asteroid.cpp
 * @brief Asteroid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/entity/Asteroid.hpp>

#include <algorithm>

namespace astro::entity {

Asteroid::Asteroid(const Params &params)
    : CircleBody{kKind, params.position, params.radius}
    , _metadata{params.metadata}
{}

void Asteroid::reset(const Params &params)
{
    _position     = params.position;
    _velocity     = math::Vec2f::zero();
    _radius       = std::max(params.radius, 0.0f);
    _alive        = true;
    _metadata     = params.metadata;
    _scanned      = false;
    _fullyScanned = false;
}

void Asteroid::markScanned(bool full) noexcept
{
    _scanned = true;
    _fullyScanned = _fullyScanned || full;
}

} // namespace astro::entity

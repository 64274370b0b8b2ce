/**
 * @file AsteroidSplitter.cpp
 * @brief AsteroidSplitter implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/entity/AsteroidSplitter.hpp>

#include <initializer_list>
#include <utility>

namespace astro::entity {

AsteroidSplitter::AsteroidSplitter(Lifecycle<Asteroid> &lifecycle, SplitConfig config) noexcept
    : _lifecycle{lifecycle}
    , _config{config}
{}

core::Expected<std::vector<AsteroidSplitter::AsteroidRef>>
AsteroidSplitter::split(const AsteroidRef &parent, math::Random &rng)
{
    std::vector<AsteroidRef> fragments;
    if (!_lifecycle.isCurrent(parent) || !parent.entity->isAlive())
        return fragments;

    const Asteroid      &asteroid = *parent.entity;
    const math::Vec2f    position = asteroid.position();
    const math::Vec2f    velocity = asteroid.velocity();
    const core::f32      radius   = asteroid.radius();
    const DebrisMetadata metadata = asteroid.metadata();

    _lifecycle.release(parent);

    if (radius <= _config.minRadius)
        return fragments;

    const core::f32 angle = rng.uniform(_config.minAngleDeg, _config.maxAngleDeg);
    const Asteroid::Params params{position, radius - _config.minRadius, metadata};

    fragments.reserve(2);
    for (const core::f32 offset : {angle, -angle})
    {
        auto acquired = _lifecycle.acquire(params);
        if (!acquired)
        {
            for (const AsteroidRef &fragment : fragments)
                _lifecycle.release(fragment);
            return std::unexpected(std::move(acquired.error()));
        }
        acquired->entity->setVelocity(velocity.rotated(offset) * _config.speedScale);
        fragments.push_back(*acquired);
    }
    return fragments;
}

} // namespace astro::entity

/**
 * @file AsteroidField.cpp
 * @brief AsteroidField implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/engine/AsteroidField.hpp>
#include <astro/core/Log.hpp>

#include <string>

namespace astro::engine {

AsteroidField::AsteroidField(entity::Lifecycle<entity::Asteroid> &lifecycle,
                             const Config &config,
                             math::Random &rng) noexcept
    : _lifecycle{lifecycle}
    , _config{config}
    , _rng{rng}
{}

core::Expected<entity::Asteroid *> AsteroidField::update(core::f32 dt)
{
    _timer += dt;
    if (_timer <= _config.spawnInterval())
        return nullptr;
    _timer = 0.0f;

    const core::f32 width  = _config.arenaWidth();
    const core::f32 height = _config.arenaHeight();
    const core::f32 margin = _config.asteroidMaxRadius();

    math::Vec2f direction;
    math::Vec2f position;
    const core::f32 t = _rng.uniform(0.0f, 1.0f);
    switch (_rng.uniformInt(0, 3))
    {
        case 0:  direction = { 1.0f,  0.0f}; position = {-margin,         t * height};      break;
        case 1:  direction = {-1.0f,  0.0f}; position = {width + margin,  t * height};      break;
        case 2:  direction = { 0.0f,  1.0f}; position = {t * width,       -margin};         break;
        default: direction = { 0.0f, -1.0f}; position = {t * width,       height + margin}; break;
    }

    const auto speed = static_cast<core::f32>(
        _rng.uniformInt(static_cast<core::i32>(_config.asteroidMinSpeed()),
                        static_cast<core::i32>(_config.asteroidMaxSpeed())));
    const auto spread = static_cast<core::f32>(
        _rng.uniformInt(-core::kAsteroidSpawnSpreadDeg, core::kAsteroidSpawnSpreadDeg));
    const math::Vec2f velocity = (direction * speed).rotated(spread);

    const auto kind = _rng.uniformInt(1, static_cast<core::i32>(_config.asteroidKinds()));
    return spawn(_config.asteroidMinRadius() * static_cast<core::f32>(kind), position, velocity);
}

core::Expected<entity::Asteroid *> AsteroidField::spawn(core::f32 radius,
                                                        math::Vec2f position,
                                                        math::Vec2f velocity)
{
    entity::Asteroid::Params params{position, radius, {}};
    if (_metadataSource)
        params.metadata = _metadataSource();

    auto acquired = ASTRO_TRY(_lifecycle.acquire(params));
    acquired.entity->setVelocity(velocity);

    core::Log::debug("FIELD", "spawned r=" + std::to_string(radius) + " at (" +
                              std::to_string(position.x) + ", " + std::to_string(position.y) + ")");
    return acquired.entity;
}

} // namespace astro::engine

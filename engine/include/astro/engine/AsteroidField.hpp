/**
 * @file AsteroidField.hpp
 * @brief Periodic asteroid spawner along the arena edges.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENGINE_ASTEROID_FIELD_HPP
    #define ASTRO_ENGINE_ASTEROID_FIELD_HPP

#include <astro/engine/Config.hpp>
#include <astro/entity/Asteroid.hpp>
#include <astro/entity/Lifecycle.hpp>
#include <astro/math/Random.hpp>

#include <functional>
#include <utility>

namespace astro::engine {

/**
 * @class AsteroidField
 * @brief Spawns one asteroid every spawn interval just outside a random
 *        arena edge, heading inward.
 *
 * The metadata source, when set, is called once per spawn; its payload
 * is attached to the asteroid as-is.
 */
class AsteroidField final {
public:
    using MetadataSource = std::function<entity::DebrisMetadata()>;

    AsteroidField(entity::Lifecycle<entity::Asteroid> &lifecycle,
                  const Config &config,
                  math::Random &rng) noexcept;

    void setMetadataSource(MetadataSource source) { _metadataSource = std::move(source); }

    /**
     * @brief Accumulates @p dt and spawns once the interval is exceeded.
     * @return The spawned asteroid, nullptr if none was due.
     */
    [[nodiscard]] core::Expected<entity::Asteroid *> update(core::f32 dt);

    /** @brief Spawns an asteroid with explicit state (metadata from the source). */
    [[nodiscard]] core::Expected<entity::Asteroid *> spawn(core::f32 radius,
                                                           math::Vec2f position,
                                                           math::Vec2f velocity);

    [[nodiscard]] core::f32 timer() const noexcept { return _timer; }

private:
    entity::Lifecycle<entity::Asteroid> &_lifecycle;
    const Config                        &_config;
    math::Random                        &_rng;
    MetadataSource                       _metadataSource;
    core::f32                            _timer{0.0f};
};

} // namespace astro::engine

#endif // ASTRO_ENGINE_ASTEROID_FIELD_HPP

/**
 * @file World.hpp
 * @brief Fixed-step simulation orchestrator.
 *
 * Owns the pools, the lifecycles, the tracking groups, the broad-phase
 * grid, the spawner and the player, and drives them in the per-step
 * order: intent -> advance -> rebuild index -> query + narrow phase ->
 * deferred releases and splits.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENGINE_WORLD_HPP
    #define ASTRO_ENGINE_WORLD_HPP

#include <astro/engine/AsteroidField.hpp>
#include <astro/engine/Config.hpp>
#include <astro/entity/AsteroidSplitter.hpp>
#include <astro/entity/EntityGroup.hpp>
#include <astro/entity/Lifecycle.hpp>
#include <astro/entity/Player.hpp>
#include <astro/entity/Shot.hpp>
#include <astro/memory/ObjectPool.hpp>
#include <astro/physics/SpatialGrid.hpp>
#include <astro/core/NonCopyable.hpp>

#include <memory>
#include <optional>

namespace astro::engine {

/** @brief What the pilot wants this step. Axes are clamped to [-1, 1]. */
struct PlayerIntent
{
    core::f32 turn{0.0f};
    core::f32 thrust{0.0f};
    bool      fire{false};
    bool      scan{false};
};

enum class ScanResult : core::u8 {
    kNone = 0,
    kQuick,
    kFull
};

/** @brief Outcome counters of one step. */
struct StepReport
{
    core::u32  shotsFired{0};
    core::u32  asteroidsSpawned{0};
    core::u32  shotHits{0};
    core::u32  fragmentsSpawned{0};
    core::u32  shotsExpired{0};
    core::u32  entitiesCulled{0};
    core::u32  candidatePairs{0};
    bool       playerHit{false};
    ScanResult scan{ScanResult::kNone};
};

struct PoolStats
{
    bool        enabled{false};
    core::usize available{0};
    core::usize active{0};
    core::usize total{0};
    core::usize maxSize{0};
    core::usize overflow{0};
};

/** @brief Pool and grid diagnostics (debug HUD equivalent). */
struct WorldStats
{
    core::u64   tick{0};
    core::usize liveAsteroids{0};
    core::usize liveShots{0};
    core::usize unpooledAsteroids{0};
    core::usize unpooledShots{0};
    PoolStats   asteroidPool;
    PoolStats   shotPool;
    core::usize gridEntities{0};
    core::usize gridCells{0};
};

class World final : private core::NonCopyable<World> {
public:
    /**
     * @brief Validates @p config and builds a world with the player at the arena centre.
     * @return The world, or the first configuration error.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<World>> create(const Config &config);

    World(World &&)            = delete;
    World &operator=(World &&) = delete;
    ~World()                   = default;

    /** @brief Advances the simulation by @p dt seconds. */
    [[nodiscard]] core::Expected<StepReport> step(core::f32 dt, const PlayerIntent &intent = {});

    /** @brief Spawns an asteroid with explicit state (external placement, tests). */
    [[nodiscard]] core::Expected<entity::Asteroid *> spawnAsteroid(math::Vec2f position,
                                                                   core::f32 radius,
                                                                   math::Vec2f velocity = {});

    /** @brief Spawns a shot with explicit state, bypassing the fire cooldown. */
    [[nodiscard]] core::Expected<entity::Shot *> spawnShot(math::Vec2f position, math::Vec2f velocity);

    /** @brief Brings a dead player back at the arena centre. */
    void respawnPlayer() noexcept;

    void setMetadataSource(AsteroidField::MetadataSource source);

    [[nodiscard]] WorldStats stats() const;

    [[nodiscard]] const Config                 &config()    const noexcept { return _config; }
    [[nodiscard]] entity::Player               &player()          noexcept { return _player; }
    [[nodiscard]] const entity::Player         &player()    const noexcept { return _player; }
    [[nodiscard]] const entity::EntityGroup    &asteroids() const noexcept { return _asteroids; }
    [[nodiscard]] const entity::EntityGroup    &shots()     const noexcept { return _shots; }
    [[nodiscard]] const physics::SpatialGrid   &grid()      const noexcept { return _grid; }
    [[nodiscard]] const entity::Asteroid       *scanTarget() const noexcept { return _scanTarget; }
    [[nodiscard]] core::f32                     scanTimer()  const noexcept { return _scanTimer; }
    [[nodiscard]] core::u64                     tick()       const noexcept { return _tick; }

private:
    using AsteroidPool = memory::ObjectPool<entity::Asteroid>;
    using ShotPool     = memory::ObjectPool<entity::Shot>;
    using AsteroidRef  = entity::Lifecycle<entity::Asteroid>::Acquired;
    using ShotRef      = entity::Lifecycle<entity::Shot>::Acquired;

    World(const Config &config,
          physics::SpatialGrid grid,
          std::optional<AsteroidPool> asteroidPool,
          std::optional<ShotPool> shotPool);

    [[nodiscard]] core::Expected<entity::Shot *> fire();
    void applyIntent(core::f32 dt, const PlayerIntent &intent);
    void advance(core::f32 dt);
    void rebuildIndex();
    void updateScan(core::f32 dt, bool scanning, StepReport &report);
    [[nodiscard]] bool outsideArena(const physics::CircleBody &body) const noexcept;
    void forgetScanTarget(const entity::Asteroid *asteroid) noexcept;

    Config                              _config;
    math::Random                        _rng;
    std::optional<AsteroidPool>         _asteroidPool;
    std::optional<ShotPool>             _shotPool;
    physics::SpatialGrid                _grid;
    entity::EntityGroup                 _updatable{"updatable"};
    entity::EntityGroup                 _asteroids{"asteroids"};
    entity::EntityGroup                 _shots{"shots"};
    entity::Lifecycle<entity::Asteroid> _asteroidLifecycle;
    entity::Lifecycle<entity::Shot>     _shotLifecycle;
    entity::AsteroidSplitter            _splitter;
    AsteroidField                       _field;
    entity::Player                      _player;
    entity::Asteroid                   *_scanTarget{nullptr};
    core::f32                           _scanTimer{0.0f};
    core::u64                           _tick{0};
};

} // namespace astro::engine

#endif // ASTRO_ENGINE_WORLD_HPP

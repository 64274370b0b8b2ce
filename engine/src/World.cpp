/**
 * @file World.cpp
 * @brief World implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/engine/World.hpp>
#include <astro/entity/Poolable.hpp>
#include <astro/core/Log.hpp>

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace astro::engine {

namespace {

template <typename Pool>
PoolStats makePoolStats(const std::optional<Pool> &pool) noexcept
{
    PoolStats stats;
    if (!pool)
        return stats;
    stats.enabled   = true;
    stats.available = pool->available();
    stats.active    = pool->active();
    stats.total     = pool->total();
    stats.maxSize   = pool->maxSize();
    stats.overflow  = pool->overflowCount();
    return stats;
}

std::string describeAsteroid(const entity::Asteroid &asteroid)
{
    const auto &metadata = asteroid.metadata();
    std::string text = "r=" + std::to_string(asteroid.radius());
    if (metadata.noradId)
        text += " norad=" + std::to_string(*metadata.noradId);
    if (metadata.record)
        text += " \"" + metadata.record->name + "\"";
    return text;
}

} // namespace

core::Expected<std::unique_ptr<World>> World::create(const Config &config)
{
    ASTRO_TRY_VOID(config.validate());

    auto grid = physics::SpatialGrid::create(config.cellSize());
    if (!grid)
        return std::unexpected(std::move(grid.error()));

    std::optional<AsteroidPool> asteroidPool;
    std::optional<ShotPool>     shotPool;
    if (config.usePools())
    {
        auto asteroids = AsteroidPool::create(
            [] { return std::make_unique<entity::Asteroid>(entity::Asteroid::Params{}); },
            config.asteroidPoolInitial(), config.asteroidPoolMax());
        if (!asteroids)
            return std::unexpected(std::move(asteroids.error()));
        asteroidPool.emplace(std::move(*asteroids));

        auto shots = ShotPool::create(
            [] { return std::make_unique<entity::Shot>(entity::Shot::Params{}); },
            config.shotPoolInitial(), config.shotPoolMax());
        if (!shots)
            return std::unexpected(std::move(shots.error()));
        shotPool.emplace(std::move(*shots));
    }

    if (config.cellSize() < 2.0f * config.asteroidMaxRadius())
    {
        core::Log::warn("WORLD", "cell size " + std::to_string(config.cellSize()) +
                                 " < 2 x max asteroid radius " + std::to_string(config.asteroidMaxRadius()) +
                                 ": broad phase may miss collisions");
    }

    std::unique_ptr<World> world{new World(config, std::move(*grid),
                                           std::move(asteroidPool), std::move(shotPool))};

    core::Log::info("WORLD", "created: arena " + std::to_string(config.arenaWidth()) + "x" +
                             std::to_string(config.arenaHeight()) + ", cell " +
                             std::to_string(config.cellSize()) +
                             (config.usePools() ? ", pooled" : ", unpooled"));
    return world;
}

World::World(const Config &config,
             physics::SpatialGrid grid,
             std::optional<AsteroidPool> asteroidPool,
             std::optional<ShotPool> shotPool)
    : _config{config}
    , _rng{config.seed()}
    , _asteroidPool{std::move(asteroidPool)}
    , _shotPool{std::move(shotPool)}
    , _grid{std::move(grid)}
    , _asteroidLifecycle{_asteroidPool ? &*_asteroidPool : nullptr}
    , _shotLifecycle{_shotPool ? &*_shotPool : nullptr}
    , _splitter{_asteroidLifecycle,
                entity::SplitConfig{config.asteroidMinRadius(), config.splitSpeedScale(),
                                    config.splitMinAngleDeg(), config.splitMaxAngleDeg()}}
    , _field{_asteroidLifecycle, _config, _rng}
    , _player{math::Vec2f{config.arenaWidth() * 0.5f, config.arenaHeight() * 0.5f}, config.playerRadius()}
{
    _asteroidLifecycle.track(_updatable);
    _asteroidLifecycle.track(_asteroids);
    _shotLifecycle.track(_updatable);
    _shotLifecycle.track(_shots);
    _updatable.add(_player);
}

core::Expected<StepReport> World::step(core::f32 dt, const PlayerIntent &intent)
{
    StepReport report;
    ++_tick;

    if (_player.isAlive())
    {
        applyIntent(dt, intent);
        if (intent.fire && _player.tryFire(_config.shotCooldown()))
        {
            auto shot = fire();
            if (!shot)
                return std::unexpected(std::move(shot.error()));
            ++report.shotsFired;
        }
    }

    advance(dt);

    if (_config.spawnerEnabled())
    {
        entity::Asteroid *spawned = ASTRO_TRY(_field.update(dt));
        if (spawned)
            ++report.asteroidsSpawned;
    }

    rebuildIndex();

    // Collisions are only recorded here; every release and split happens
    // once the groups are no longer being iterated.  Identities are taken
    // while the entities are still live, so a late release is a no-op.
    std::vector<ShotRef>                         shotsToRelease;
    std::vector<AsteroidRef>                     asteroidsToSplit;
    std::vector<AsteroidRef>                     asteroidsToCull;
    std::unordered_set<const entity::Asteroid *> hitAsteroids;

    for (physics::CircleBody *body : _shots.members())
    {
        auto *shot = entity::bodyCast<entity::Shot>(body);
        if (!shot || !shot->isAlive())
            continue;
        const auto shotRef = _shotLifecycle.find(shot);
        if (!shotRef)
            continue;

        if (shot->isExpired())
        {
            shotsToRelease.push_back(*shotRef);
            ++report.shotsExpired;
            continue;
        }

        bool hit = false;
        for (physics::CircleBody *candidate : _grid.query(*shot))
        {
            auto *asteroid = entity::bodyCast<entity::Asteroid>(candidate);
            if (!asteroid || !asteroid->isAlive())
                continue;
            ++report.candidatePairs;
            if (!shot->collidesWith(*asteroid))
                continue;

            hit = true;
            ++report.shotHits;
            if (hitAsteroids.insert(asteroid).second)
            {
                if (const auto ref = _asteroidLifecycle.find(asteroid))
                    asteroidsToSplit.push_back(*ref);
            }
            break;
        }

        if (hit)
        {
            shotsToRelease.push_back(*shotRef);
        }
        else if (outsideArena(*shot))
        {
            shotsToRelease.push_back(*shotRef);
            ++report.entitiesCulled;
        }
    }

    if (_player.isAlive())
    {
        for (physics::CircleBody *candidate : _grid.query(_player))
        {
            auto *asteroid = entity::bodyCast<entity::Asteroid>(candidate);
            if (!asteroid || !asteroid->isAlive())
                continue;
            ++report.candidatePairs;
            if (asteroid->collidesWith(_player))
            {
                report.playerHit = true;
                break;
            }
        }
        updateScan(dt, intent.scan && !report.playerHit, report);
    }

    for (physics::CircleBody *body : _asteroids.members())
    {
        auto *asteroid = entity::bodyCast<entity::Asteroid>(body);
        if (!asteroid || !asteroid->isAlive() || hitAsteroids.contains(asteroid) || !outsideArena(*asteroid))
            continue;
        if (const auto ref = _asteroidLifecycle.find(asteroid))
            asteroidsToCull.push_back(*ref);
    }

    for (const ShotRef &shot : shotsToRelease)
        _shotLifecycle.release(shot);

    for (const AsteroidRef &asteroid : asteroidsToCull)
    {
        forgetScanTarget(asteroid.entity);
        if (_asteroidLifecycle.release(asteroid))
            ++report.entitiesCulled;
    }

    for (const AsteroidRef &asteroid : asteroidsToSplit)
    {
        forgetScanTarget(asteroid.entity);
        const auto fragments = ASTRO_TRY(_splitter.split(asteroid, _rng));
        report.fragmentsSpawned += static_cast<core::u32>(fragments.size());
    }

    if (report.playerHit)
    {
        _player.markDead();
        _scanTarget = nullptr;
        _scanTimer  = 0.0f;
        core::Log::warn("WORLD", "player hit at tick " + std::to_string(_tick));
    }

    return report;
}

core::Expected<entity::Asteroid *> World::spawnAsteroid(math::Vec2f position,
                                                        core::f32 radius,
                                                        math::Vec2f velocity)
{
    return _field.spawn(radius, position, velocity);
}

core::Expected<entity::Shot *> World::spawnShot(math::Vec2f position, math::Vec2f velocity)
{
    auto acquired = ASTRO_TRY(_shotLifecycle.acquire(
        entity::Shot::Params{position, _config.shotRadius(), _config.shotLifetime()}));
    acquired.entity->setVelocity(velocity);
    return acquired.entity;
}

void World::respawnPlayer() noexcept
{
    _player.respawn({_config.arenaWidth() * 0.5f, _config.arenaHeight() * 0.5f});
}

void World::setMetadataSource(AsteroidField::MetadataSource source)
{
    _field.setMetadataSource(std::move(source));
}

WorldStats World::stats() const
{
    WorldStats stats;
    stats.tick              = _tick;
    stats.liveAsteroids     = _asteroidLifecycle.liveCount();
    stats.liveShots         = _shotLifecycle.liveCount();
    stats.unpooledAsteroids = _asteroidLifecycle.unpooledCount();
    stats.unpooledShots     = _shotLifecycle.unpooledCount();
    stats.asteroidPool      = makePoolStats(_asteroidPool);
    stats.shotPool          = makePoolStats(_shotPool);
    stats.gridEntities      = _grid.entityCount();
    stats.gridCells         = _grid.cellCount();
    return stats;
}

core::Expected<entity::Shot *> World::fire()
{
    return spawnShot(_player.position(), _player.forward() * _config.shotSpeed());
}

void World::applyIntent(core::f32 dt, const PlayerIntent &intent)
{
    _player.tickCooldown(dt);

    const core::f32 turn = std::clamp(intent.turn, -1.0f, 1.0f);
    if (turn != 0.0f)
        _player.turn(_config.playerTurnSpeed() * turn, dt);

    const core::f32 thrust = std::clamp(intent.thrust, -1.0f, 1.0f);
    if (thrust != 0.0f)
        _player.thrust(_config.playerSpeed() * thrust, dt);
}

void World::advance(core::f32 dt)
{
    for (physics::CircleBody *body : _updatable.members())
    {
        switch (body->kind())
        {
            case physics::BodyKind::kAsteroid: static_cast<entity::Asteroid *>(body)->update(dt); break;
            case physics::BodyKind::kShot:     static_cast<entity::Shot *>(body)->update(dt);     break;
            case physics::BodyKind::kPlayer:   body->advance(dt);                                 break;
        }
    }
}

void World::rebuildIndex()
{
    _grid.clear();
    for (physics::CircleBody *body : _asteroids.members())
    {
        if (body->isAlive())
            _grid.insert(*body);
    }
    for (physics::CircleBody *body : _shots.members())
    {
        if (body->isAlive())
            _grid.insert(*body);
    }
    if (_player.isAlive())
        _grid.insert(_player);
}

void World::updateScan(core::f32 dt, bool scanning, StepReport &report)
{
    if (!scanning)
    {
        _scanTarget = nullptr;
        _scanTimer  = 0.0f;
        return;
    }

    const math::Vec2f origin = _player.position();
    const core::f32   range  = _config.scanRange();

    entity::Asteroid *nearest     = nullptr;
    core::f32         nearestDist = range;
    for (physics::CircleBody *candidate : _grid.queryPoint(origin.x, origin.y, range))
    {
        auto *asteroid = entity::bodyCast<entity::Asteroid>(candidate);
        if (!asteroid || !asteroid->isAlive())
            continue;
        const core::f32 dist = origin.distance(asteroid->position());
        if (dist < nearestDist)
        {
            nearestDist = dist;
            nearest     = asteroid;
        }
    }

    if (nearest && nearest != _scanTarget)
    {
        _scanTarget = nearest;
        _scanTimer  = 0.0f;
    }
    if (!_scanTarget)
        return;

    if (!_scanTarget->isAlive() || origin.distance(_scanTarget->position()) > range)
    {
        _scanTarget = nullptr;
        _scanTimer  = 0.0f;
        return;
    }

    _scanTimer += dt;
    if (_scanTimer >= _config.scanFullTime() && !_scanTarget->isFullyScanned())
    {
        _scanTarget->markScanned(true);
        report.scan = ScanResult::kFull;
        core::Log::info("WORLD", "full scan: " + describeAsteroid(*_scanTarget));
    }
    else if (_scanTimer >= _config.scanQuickTime() && !_scanTarget->isScanned())
    {
        _scanTarget->markScanned(false);
        report.scan = ScanResult::kQuick;
        core::Log::info("WORLD", "quick scan: " + describeAsteroid(*_scanTarget));
    }
}

bool World::outsideArena(const physics::CircleBody &body) const noexcept
{
    const core::f32   margin = _config.asteroidMaxRadius();
    const math::Vec2f p      = body.position();
    return p.x < -margin || p.x > _config.arenaWidth() + margin ||
           p.y < -margin || p.y > _config.arenaHeight() + margin;
}

void World::forgetScanTarget(const entity::Asteroid *asteroid) noexcept
{
    if (_scanTarget == asteroid)
    {
        _scanTarget = nullptr;
        _scanTimer  = 0.0f;
    }
}

} // namespace astro::engine

/**
 * @file TestWorld.cpp
 * @brief Scenario tests for engine::World.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <astro/engine/World.hpp>
#include <astro/core/Log.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace astro::engine {

using Catch::Matchers::WithinAbs;

namespace {

class RecordingLogger final : public core::ILogger {
public:
    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        if (level == core::LogLevel::kWarn)
            warnings.push_back(std::string{tag} + ": " + std::string{message});
    }

    std::vector<std::string> warnings;
};

/** Spawner off so that every body in the arena is placed by the test. */
Config::Builder quietArena()
{
    Config::Builder builder;
    builder.enableSpawner(false).seed(1);
    return builder;
}

std::unique_ptr<World> makeWorld(const Config &config)
{
    auto world = World::create(config);
    REQUIRE(world.has_value());
    return std::move(*world);
}

StepReport step(World &world, core::f32 dt, const PlayerIntent &intent = {})
{
    auto report = world.step(dt, intent);
    REQUIRE(report.has_value());
    return *report;
}

void requirePoolConservation(const PoolStats &pool)
{
    REQUIRE(pool.total == pool.available + pool.active);
    REQUIRE(pool.total <= pool.maxSize);
}

} // namespace

TEST_CASE("World::create rejects invalid configuration", "[engine][world]")
{
    auto badCell = World::create(quietArena().cellSize(0.0f).build());
    REQUIRE_FALSE(badCell.has_value());
    REQUIRE(badCell.error().code() == core::ErrorCode::kInvalidArgument);

    auto badPool = World::create(quietArena().asteroidPool(3, 2).build());
    REQUIRE_FALSE(badPool.has_value());
    REQUIRE(badPool.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("World warns when cells are too small for the largest asteroid", "[engine][world]")
{
    RecordingLogger logger;
    core::Log::setLogger(&logger);

    auto world = World::create(quietArena().cellSize(64.0f).build());
    core::Log::setLogger(nullptr);

    REQUIRE(world.has_value());
    REQUIRE(logger.warnings.size() == 1);
    REQUIRE(logger.warnings.front().rfind("WORLD", 0) == 0);
}

TEST_CASE("World starts with the player alone at the centre", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());

    REQUIRE(world->player().isAlive());
    REQUIRE(world->player().position() == math::Vec2f{640.0f, 360.0f});
    REQUIRE(world->asteroids().empty());
    REQUIRE(world->shots().empty());

    const WorldStats stats = world->stats();
    REQUIRE(stats.asteroidPool.enabled);
    REQUIRE(stats.asteroidPool.total == core::kAsteroidPoolInitial);
    REQUIRE(stats.shotPool.available == core::kShotPoolInitial);

    const StepReport report = step(*world, core::kFixedDeltaTime);
    REQUIRE(report.candidatePairs == 0);
    REQUIRE_FALSE(report.playerHit);
    REQUIRE(world->stats().gridEntities == 1);
    REQUIRE(world->tick() == 1);
}

TEST_CASE("World splits an asteroid hit by a shot", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());

    auto asteroid = world->spawnAsteroid({200.0f, 200.0f}, 40.0f);
    auto shot     = world->spawnShot({200.0f, 150.0f}, {0.0f, 100.0f});
    REQUIRE(asteroid.has_value());
    REQUIRE(shot.has_value());
    REQUIRE(world->stats().shotPool.active == 1);

    const StepReport report = step(*world, 0.1f);

    REQUIRE(report.shotHits == 1);
    REQUIRE(report.fragmentsSpawned == 2);
    REQUIRE(report.candidatePairs >= 1);
    REQUIRE(world->shots().empty());
    REQUIRE(world->asteroids().size() == 2);

    for (physics::CircleBody *body : world->asteroids().members())
    {
        REQUIRE(body->radius() == 20.0f);
        REQUIRE(body->position() == math::Vec2f{200.0f, 200.0f});
    }

    const WorldStats stats = world->stats();
    REQUIRE(stats.liveAsteroids == 2);
    REQUIRE(stats.liveShots == 0);
    REQUIRE(stats.shotPool.active == 0);
    requirePoolConservation(stats.asteroidPool);
    requirePoolConservation(stats.shotPool);
}

TEST_CASE("World splits an asteroid once even when two shots hit it", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());

    REQUIRE(world->spawnAsteroid({300.0f, 300.0f}, 60.0f).has_value());
    REQUIRE(world->spawnShot({300.0f, 250.0f}, {}).has_value());
    REQUIRE(world->spawnShot({250.0f, 300.0f}, {}).has_value());

    const StepReport report = step(*world, 0.1f);

    REQUIRE(report.shotHits == 2);
    REQUIRE(report.fragmentsSpawned == 2);
    REQUIRE(world->shots().empty());
    REQUIRE(world->asteroids().size() == 2);
}

TEST_CASE("World destroys the smallest asteroids without fragments", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());

    REQUIRE(world->spawnAsteroid({300.0f, 300.0f}, 20.0f).has_value());
    REQUIRE(world->spawnShot({300.0f, 280.0f}, {}).has_value());

    const StepReport report = step(*world, 0.1f);
    REQUIRE(report.shotHits == 1);
    REQUIRE(report.fragmentsSpawned == 0);
    REQUIRE(world->asteroids().empty());
    REQUIRE(world->stats().asteroidPool.active == 0);
}

TEST_CASE("World expires shots after their lifetime", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());
    REQUIRE(world->spawnShot({100.0f, 100.0f}, {}).has_value());

    REQUIRE(step(*world, 1.0f).shotsExpired == 0);
    REQUIRE(world->shots().size() == 1);

    const StepReport report = step(*world, 1.0f);
    REQUIRE(report.shotsExpired == 1);
    REQUIRE(world->shots().empty());
    REQUIRE(world->stats().shotPool.active == 0);
}

TEST_CASE("World fires along the heading and honours the cooldown", "[engine][world]")
{
    auto world = makeWorld(quietArena().shotCooldown(0.5f).build());
    PlayerIntent intent;
    intent.fire = true;

    REQUIRE(step(*world, 0.25f, intent).shotsFired == 1);
    REQUIRE(world->shots().size() == 1);

    const physics::CircleBody *shot = world->shots().members().front();
    REQUIRE_THAT(shot->velocity().x, WithinAbs(0.0, 1e-4));
    REQUIRE_THAT(shot->velocity().y, WithinAbs(core::kShotSpeed, 1e-3));

    REQUIRE(step(*world, 0.25f, intent).shotsFired == 0);
    REQUIRE(step(*world, 0.25f, intent).shotsFired == 1);
    REQUIRE(world->shots().size() == 2);
}

TEST_CASE("World applies turn and thrust intent", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());

    PlayerIntent intent;
    intent.thrust = 1.0f;
    step(*world, 0.5f, intent);
    REQUIRE_THAT(world->player().position().y, WithinAbs(360.0 + core::kPlayerSpeed * 0.5, 1e-3));

    intent.thrust = 0.0f;
    intent.turn   = 4.0f;
    step(*world, 0.1f, intent);
    REQUIRE_THAT(world->player().rotation(), WithinAbs(core::kPlayerTurnSpeed * 0.1, 1e-3));
}

TEST_CASE("World reports a player hit and keeps the player out until respawn", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());
    REQUIRE(world->spawnAsteroid({650.0f, 360.0f}, 40.0f).has_value());

    const StepReport hit = step(*world, 0.1f);
    REQUIRE(hit.playerHit);
    REQUIRE_FALSE(world->player().isAlive());

    PlayerIntent intent;
    intent.fire = true;
    const StepReport after = step(*world, 0.1f, intent);
    REQUIRE_FALSE(after.playerHit);
    REQUIRE(after.shotsFired == 0);
    REQUIRE(world->stats().gridEntities == 1);

    world->respawnPlayer();
    REQUIRE(world->player().isAlive());
}

TEST_CASE("World culls entities that leave the arena", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());

    REQUIRE(world->spawnAsteroid({-200.0f, 360.0f}, 40.0f).has_value());
    REQUIRE(world->spawnAsteroid({-60.0f, 360.0f}, 40.0f, {50.0f, 0.0f}).has_value());
    REQUIRE(world->spawnShot({640.0f, 1000.0f}, {0.0f, 10.0f}).has_value());

    const StepReport report = step(*world, 0.1f);
    REQUIRE(report.entitiesCulled == 2);
    REQUIRE(world->asteroids().size() == 1);
    REQUIRE(world->shots().empty());
}

TEST_CASE("World scan marks the nearest asteroid quick then full", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());
    auto target = world->spawnAsteroid({740.0f, 360.0f}, 20.0f);
    REQUIRE(target.has_value());

    PlayerIntent intent;
    intent.scan = true;

    for (int i = 0; i < 3; ++i)
        REQUIRE(step(*world, 0.25f, intent).scan == ScanResult::kNone);
    REQUIRE(world->scanTarget() == *target);

    REQUIRE(step(*world, 0.25f, intent).scan == ScanResult::kQuick);
    REQUIRE((*target)->isScanned());
    REQUIRE_FALSE((*target)->isFullyScanned());

    for (int i = 0; i < 7; ++i)
        REQUIRE(step(*world, 0.25f, intent).scan == ScanResult::kNone);
    REQUIRE(step(*world, 0.25f, intent).scan == ScanResult::kFull);
    REQUIRE((*target)->isFullyScanned());

    REQUIRE(step(*world, 0.25f, intent).scan == ScanResult::kNone);

    intent.scan = false;
    step(*world, 0.25f, intent);
    REQUIRE(world->scanTarget() == nullptr);
    REQUIRE(world->scanTimer() == 0.0f);
}

TEST_CASE("World scan ignores asteroids out of range", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());
    REQUIRE(world->spawnAsteroid({1000.0f, 360.0f}, 20.0f).has_value());

    PlayerIntent intent;
    intent.scan = true;
    step(*world, 0.25f, intent);
    REQUIRE(world->scanTarget() == nullptr);
}

TEST_CASE("World works without pools", "[engine][world]")
{
    auto world = makeWorld(quietArena().usePools(false).build());

    REQUIRE(world->spawnAsteroid({200.0f, 200.0f}, 40.0f).has_value());
    REQUIRE(world->spawnShot({200.0f, 160.0f}, {}).has_value());

    const StepReport report = step(*world, 0.1f);
    REQUIRE(report.fragmentsSpawned == 2);

    const WorldStats stats = world->stats();
    REQUIRE_FALSE(stats.asteroidPool.enabled);
    REQUIRE_FALSE(stats.shotPool.enabled);
    REQUIRE(stats.unpooledAsteroids == 2);
    REQUIRE(stats.unpooledShots == 0);
    REQUIRE(stats.liveAsteroids == 2);
}

TEST_CASE("World keeps pools and groups consistent over a long run", "[engine][world][soak]")
{
    auto world = makeWorld(Config::Builder{}.seed(8).spawnInterval(0.1f).asteroidPool(4, 16).shotPool(2, 8).build());

    PlayerIntent intent;
    intent.fire = true;
    intent.turn = 0.5f;
    intent.scan = true;

    core::usize totalAsteroids = world->stats().asteroidPool.total;
    for (int tick = 0; tick < 3000; ++tick)
    {
        const StepReport report = step(*world, core::kFixedDeltaTime, intent);
        if (report.playerHit)
            world->respawnPlayer();

        const WorldStats stats = world->stats();
        requirePoolConservation(stats.asteroidPool);
        requirePoolConservation(stats.shotPool);
        REQUIRE(stats.asteroidPool.total >= totalAsteroids);
        totalAsteroids = stats.asteroidPool.total;

        REQUIRE(stats.liveAsteroids == world->asteroids().size());
        REQUIRE(stats.liveShots == world->shots().size());
        REQUIRE(stats.liveAsteroids == stats.asteroidPool.active + stats.unpooledAsteroids);

        for (physics::CircleBody *body : world->asteroids().members())
            REQUIRE(body->isAlive());
    }
}

TEST_CASE("World forwards spawner metadata", "[engine][world]")
{
    auto world = makeWorld(quietArena().build());
    world->setMetadataSource([] { return entity::DebrisMetadata{25544u, nullptr}; });

    auto asteroid = world->spawnAsteroid({100.0f, 100.0f}, 60.0f);
    REQUIRE(asteroid.has_value());
    REQUIRE((*asteroid)->metadata().noradId == 25544u);
}

} // namespace astro::engine

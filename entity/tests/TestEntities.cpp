/**
 * @file TestEntities.cpp
 * @brief Unit tests for the Asteroid, Shot and Player entity kinds.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <astro/entity/Asteroid.hpp>
#include <astro/entity/Player.hpp>
#include <astro/entity/Poolable.hpp>
#include <astro/entity/Shot.hpp>

namespace astro::entity {

using Catch::Matchers::WithinAbs;

static_assert(Poolable<Asteroid>);
static_assert(Poolable<Shot>);

TEST_CASE("bodyCast checks the discriminator", "[entity][kind]")
{
    Asteroid asteroid{Asteroid::Params{}};
    Shot shot{Shot::Params{}};
    physics::CircleBody *asBody = &asteroid;

    REQUIRE(bodyCast<Asteroid>(asBody) == &asteroid);
    REQUIRE(bodyCast<Shot>(asBody) == nullptr);
    REQUIRE(bodyCast<Shot>(&shot) == &shot);
    REQUIRE(bodyCast<Asteroid>(nullptr) == nullptr);
}

TEST_CASE("Asteroid scan flags", "[entity][asteroid]")
{
    Asteroid asteroid{Asteroid::Params{{0.0f, 0.0f}, 40.0f, {}}};
    REQUIRE_FALSE(asteroid.isScanned());

    asteroid.markScanned(false);
    REQUIRE(asteroid.isScanned());
    REQUIRE_FALSE(asteroid.isFullyScanned());

    asteroid.markScanned(true);
    asteroid.markScanned(false);
    REQUIRE(asteroid.isFullyScanned());
}

TEST_CASE("Shot ages and expires", "[entity][shot]")
{
    Shot shot{Shot::Params{{0.0f, 0.0f}}};
    REQUIRE(shot.radius() == core::kShotRadius);
    REQUIRE(shot.maxLifetime() == core::kShotLifetime);

    shot.setVelocity({0.0f, 100.0f});
    shot.update(1.0f);
    REQUIRE_FALSE(shot.isExpired());
    REQUIRE(shot.position() == math::Vec2f{0.0f, 100.0f});

    shot.update(1.0f);
    REQUIRE(shot.isExpired());

    shot.markDead();
    shot.update(1.0f);
    REQUIRE(shot.lifetime() == 2.0f);

    shot.reset({{1.0f, 1.0f}});
    REQUIRE(shot.isAlive());
    REQUIRE_FALSE(shot.isExpired());
    REQUIRE(shot.velocity() == math::Vec2f::zero());
}

TEST_CASE("Player turns, thrusts and respects the fire cooldown", "[entity][player]")
{
    Player player{math::Vec2f{100.0f, 100.0f}};
    REQUIRE(player.radius() == core::kPlayerRadius);
    REQUIRE(player.forward() == math::Vec2f::unitY());

    player.thrust(200.0f, 0.5f);
    REQUIRE_THAT(player.position().y, WithinAbs(200.0, 1e-4));

    player.turn(300.0f, 0.3f);
    REQUIRE_THAT(player.rotation(), WithinAbs(90.0, 1e-4));
    REQUIRE_THAT(player.forward().x, WithinAbs(-1.0, 1e-5));
    REQUIRE_THAT(player.forward().y, WithinAbs(0.0, 1e-5));

    REQUIRE(player.tryFire(0.3f));
    REQUIRE_FALSE(player.tryFire(0.3f));
    player.tickCooldown(0.2f);
    REQUIRE_FALSE(player.tryFire(0.3f));
    player.tickCooldown(0.2f);
    REQUIRE(player.cooldownRemaining() == 0.0f);
    REQUIRE(player.tryFire(0.3f));

    player.markDead();
    player.tickCooldown(1.0f);
    REQUIRE_FALSE(player.tryFire(0.3f));

    player.respawn({5.0f, 5.0f});
    REQUIRE(player.isAlive());
    REQUIRE(player.rotation() == 0.0f);
    REQUIRE(player.tryFire(0.3f));
}

} // namespace astro::entity

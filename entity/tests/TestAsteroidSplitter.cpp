/**
 * @file TestAsteroidSplitter.cpp
 * @brief Unit tests for entity::AsteroidSplitter.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <astro/entity/AsteroidSplitter.hpp>

#include <cmath>
#include <memory>
#include <numbers>
#include <utility>

namespace astro::entity {

using Catch::Matchers::WithinAbs;

namespace {

memory::ObjectPool<Asteroid> makePool(core::usize initial, core::usize maxSize)
{
    auto pool = memory::ObjectPool<Asteroid>::create(
        [] { return std::make_unique<Asteroid>(Asteroid::Params{}); }, initial, maxSize);
    REQUIRE(pool.has_value());
    return std::move(*pool);
}

/** Signed angle in degrees from @p from to @p to. */
double angleBetween(math::Vec2f from, math::Vec2f to)
{
    const double cross = static_cast<double>(from.x) * to.y - static_cast<double>(from.y) * to.x;
    const double dot   = static_cast<double>(from.x) * to.x + static_cast<double>(from.y) * to.y;
    return std::atan2(cross, dot) * 180.0 / std::numbers::pi;
}

} // namespace

TEST_CASE("Splitting yields two smaller, diverging fragments", "[entity][split]")
{
    auto pool = makePool(4, 8);
    Lifecycle<Asteroid> lifecycle{&pool};
    EntityGroup asteroids{"asteroids"};
    lifecycle.track(asteroids);
    AsteroidSplitter splitter{lifecycle};
    math::Random rng{11};

    for (int round = 0; round < 20; ++round)
    {
        auto parent = lifecycle.acquire({{100.0f, 200.0f}, 60.0f, {}});
        REQUIRE(parent.has_value());
        const math::Vec2f velocity{40.0f, 30.0f};
        parent->entity->setVelocity(velocity);

        auto fragments = splitter.split(*parent, rng);
        REQUIRE(fragments.has_value());
        REQUIRE(fragments->size() == 2);

        const Asteroid *plus  = (*fragments)[0].entity;
        const Asteroid *minus = (*fragments)[1].entity;
        for (const auto &ref : *fragments)
        {
            const Asteroid *fragment = ref.entity;
            REQUIRE(fragment->isAlive());
            REQUIRE(fragment->radius() == 40.0f);
            REQUIRE(fragment->position() == math::Vec2f{100.0f, 200.0f});
            REQUIRE_THAT(fragment->velocity().length(), WithinAbs(velocity.length() * 1.2, 1e-3));
            REQUIRE(asteroids.contains(fragment));
        }

        const double theta = angleBetween(velocity, plus->velocity());
        REQUIRE(theta >= 20.0 - 1e-3);
        REQUIRE(theta <= 50.0 + 1e-3);
        REQUIRE_THAT(angleBetween(velocity, minus->velocity()), WithinAbs(-theta, 1e-3));

        for (const auto &fragment : *fragments)
            REQUIRE(lifecycle.release(fragment));
    }
    REQUIRE(asteroids.empty());
}

TEST_CASE("Splitting reads the parent before releasing it", "[entity][split]")
{
    // With a LIFO pool the first fragment reuses the parent's instance.
    auto pool = makePool(0, 4);
    Lifecycle<Asteroid> lifecycle{&pool};
    AsteroidSplitter splitter{lifecycle, SplitConfig{20.0f, 1.2f, 30.0f, 30.0f}};
    math::Random rng{5};

    auto parent = lifecycle.acquire({{5.0f, -5.0f}, 40.0f, {}});
    REQUIRE(parent.has_value());
    Asteroid *address = parent->entity;
    address->setVelocity({100.0f, 0.0f});

    auto fragments = splitter.split(*parent, rng);
    REQUIRE(fragments.has_value());
    REQUIRE(fragments->size() == 2);
    REQUIRE((*fragments)[0].entity == address);
    REQUIRE((*fragments)[1].entity != address);

    const math::Vec2f expectedPlus  = math::Vec2f{100.0f, 0.0f}.rotated(30.0f) * 1.2f;
    const math::Vec2f expectedMinus = math::Vec2f{100.0f, 0.0f}.rotated(-30.0f) * 1.2f;
    REQUIRE_THAT((*fragments)[0]->velocity().x, WithinAbs(expectedPlus.x, 1e-3));
    REQUIRE_THAT((*fragments)[0]->velocity().y, WithinAbs(expectedPlus.y, 1e-3));
    REQUIRE_THAT((*fragments)[1]->velocity().x, WithinAbs(expectedMinus.x, 1e-3));
    REQUIRE_THAT((*fragments)[1]->velocity().y, WithinAbs(expectedMinus.y, 1e-3));
    REQUIRE((*fragments)[0]->radius() == 20.0f);
    REQUIRE((*fragments)[1]->position() == math::Vec2f{5.0f, -5.0f});
    REQUIRE(pool.active() == 2);
}

TEST_CASE("Splitting at or below the minimum radius leaves nothing", "[entity][split]")
{
    auto pool = makePool(2, 4);
    Lifecycle<Asteroid> lifecycle{&pool};
    AsteroidSplitter splitter{lifecycle};
    math::Random rng{1};

    auto smallest = lifecycle.acquire({{0.0f, 0.0f}, core::kAsteroidMinRadius, {}});
    REQUIRE(smallest.has_value());

    auto fragments = splitter.split(*smallest, rng);
    REQUIRE(fragments.has_value());
    REQUIRE(fragments->empty());
    REQUIRE_FALSE(smallest->entity->isAlive());
    REQUIRE(pool.active() == 0);
}

TEST_CASE("Splitting a released or foreign asteroid is a no-op", "[entity][split]")
{
    auto pool = makePool(2, 4);
    Lifecycle<Asteroid> lifecycle{&pool};
    AsteroidSplitter splitter{lifecycle};
    math::Random rng{1};

    auto parent = lifecycle.acquire({{0.0f, 0.0f}, 60.0f, {}});
    REQUIRE(parent.has_value());
    auto first = splitter.split(*parent, rng);
    REQUIRE(first.has_value());
    REQUIRE(first->size() == 2);
    const auto active = pool.active();

    // The parent's slot now holds the first fragment.
    auto second = splitter.split(*parent, rng);
    REQUIRE(second.has_value());
    REQUIRE(second->empty());
    REQUIRE(pool.active() == active);
    for (const auto &fragment : *first)
    {
        REQUIRE(lifecycle.isCurrent(fragment));
        REQUIRE(fragment.entity->isAlive());
        REQUIRE(fragment.entity->radius() == 40.0f);
    }

    Asteroid stranger{Asteroid::Params{{0.0f, 0.0f}, 60.0f, {}}};
    auto third = splitter.split(AsteroidSplitter::AsteroidRef{&stranger}, rng);
    REQUIRE(third.has_value());
    REQUIRE(third->empty());
    REQUIRE(stranger.isAlive());
}

TEST_CASE("Splitting propagates metadata to both fragments", "[entity][split]")
{
    Lifecycle<Asteroid> lifecycle;
    AsteroidSplitter splitter{lifecycle};
    math::Random rng{9};

    auto record = std::make_shared<const DebrisRecord>(DebrisRecord{"COSMOS 2251 DEB", "DEBRIS", "CIS", "1993-06-16"});
    auto parent = lifecycle.acquire({{0.0f, 0.0f}, 60.0f, {22675u, record}});
    REQUIRE(parent.has_value());

    auto fragments = splitter.split(*parent, rng);
    REQUIRE(fragments.has_value());
    REQUIRE(fragments->size() == 2);
    for (const auto &ref : *fragments)
    {
        const Asteroid *fragment = ref.entity;
        REQUIRE(fragment->metadata().noradId == 22675u);
        REQUIRE(fragment->metadata().record == record);
        REQUIRE_FALSE(fragment->isScanned());
    }
    REQUIRE(lifecycle.unpooledCount() == 2);
}

} // namespace astro::entity

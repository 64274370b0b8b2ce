/**
 * @file main.cpp
 * @brief Broad-phase benchmark: naive all-pairs vs brute-force index vs grid.
 *
 * Scenario per frame: N asteroids, 20 shots and one player; shots and the
 * player test against asteroids only.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/core/Types.hpp>
#include <astro/core/Log.hpp>
#include <astro/core/Constants.hpp>
#include <astro/entity/Asteroid.hpp>
#include <astro/entity/Player.hpp>
#include <astro/entity/Shot.hpp>
#include <astro/math/Random.hpp>
#include <astro/physics/BruteForceIndex.hpp>
#include <astro/physics/SpatialGrid.hpp>

#include <chrono>
#include <cstdio>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

using namespace astro;

namespace {

constexpr int       kIterations = 500;
constexpr int       kShotCount  = 20;
constexpr core::f32 kBenchCellSize = 128.0f;

struct Scene
{
    std::vector<std::unique_ptr<entity::Asteroid>> asteroids;
    std::vector<std::unique_ptr<entity::Shot>>     shots;
    entity::Player                                 player{math::Vec2f{core::kArenaWidth * 0.5f, core::kArenaHeight * 0.5f}};
};

struct Result
{
    core::f64 ms{0.0};
    core::u64 checksPerFrame{0};
    core::u64 hits{0};
};

Scene makeScene(int asteroidCount, math::Random &rng)
{
    Scene scene;
    for (int i = 0; i < asteroidCount; ++i)
    {
        scene.asteroids.push_back(std::make_unique<entity::Asteroid>(entity::Asteroid::Params{
            {rng.uniform(0.0f, core::kArenaWidth), rng.uniform(0.0f, core::kArenaHeight)},
            rng.uniform(core::kAsteroidMinRadius, core::kAsteroidMaxRadius),
            {}}));
    }
    for (int i = 0; i < kShotCount; ++i)
    {
        scene.shots.push_back(std::make_unique<entity::Shot>(entity::Shot::Params{
            {rng.uniform(0.0f, core::kArenaWidth), rng.uniform(0.0f, core::kArenaHeight)}}));
    }
    return scene;
}

template <typename Fn>
Result timeFrames(Fn &&frame)
{
    Result result;
    core::u64 checks = 0;
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < kIterations; ++i)
        frame(checks, result.hits);
    const auto end = std::chrono::steady_clock::now();
    result.ms             = std::chrono::duration<core::f64, std::milli>(end - start).count();
    result.checksPerFrame = checks / kIterations;
    return result;
}

Result runNaive(const Scene &scene)
{
    return timeFrames([&](core::u64 &checks, core::u64 &hits) {
        for (const auto &shot : scene.shots)
        {
            for (const auto &asteroid : scene.asteroids)
            {
                ++checks;
                hits += shot->collidesWith(*asteroid) ? 1 : 0;
            }
        }
        for (const auto &asteroid : scene.asteroids)
        {
            ++checks;
            hits += scene.player.collidesWith(*asteroid) ? 1 : 0;
        }
    });
}

Result runIndexed(const Scene &scene, physics::ISpatialIndex &index)
{
    return timeFrames([&](core::u64 &checks, core::u64 &hits) {
        index.clear();
        for (const auto &asteroid : scene.asteroids)
            index.insert(*asteroid);

        const auto narrow = [&](const physics::CircleBody &probe) {
            index.query(probe, [&](physics::CircleBody &other) {
                if (other.kind() != physics::BodyKind::kAsteroid)
                    return;
                ++checks;
                hits += probe.collidesWith(other) ? 1 : 0;
            });
        };
        for (const auto &shot : scene.shots)
            narrow(*shot);
        narrow(scene.player);
    });
}

void printRow(const char *label, const Result &result, core::f64 baselineMs)
{
    std::printf("  %-14s %10.3f ms  %8llu checks/frame  %6.2fx\n",
                label, result.ms,
                static_cast<unsigned long long>(result.checksPerFrame),
                result.ms > 0.0 ? baselineMs / result.ms : 0.0);
}

} // namespace

int main()
{
    core::Log::setMinLevel(core::LogLevel::kWarn);

    auto grid = physics::SpatialGrid::create(kBenchCellSize);
    if (!grid)
    {
        core::Log::fatal("bench", grid.error().format());
        return 1;
    }
    physics::BruteForceIndex brute;
    math::Random rng{42};

    std::printf("Broad-phase benchmark: N asteroids, %d shots, 1 player, %d frames\n\n",
                kShotCount, kIterations);

    for (const int count : {50, 100, 250, 500})
    {
        const Scene scene = makeScene(count, rng);

        const Result naive   = runNaive(scene);
        const Result linear  = runIndexed(scene, brute);
        const Result hashed  = runIndexed(scene, *grid);

        std::printf("N = %d\n", count);
        printRow("naive", naive, naive.ms);
        printRow("brute-force", linear, naive.ms);
        printRow("grid", hashed, naive.ms);

        if (hashed.hits != naive.hits)
        {
            core::Log::error("bench", "grid hit count " + std::to_string(hashed.hits) +
                                      " differs from naive " + std::to_string(naive.hits));
            return 1;
        }
        std::printf("\n");
    }
    return 0;
}

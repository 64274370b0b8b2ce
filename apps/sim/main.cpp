/**
 * @file main.cpp
 * @brief Headless simulation run with an autopilot pilot.
 *
 * Usage: astro_sim [ticks] [seed]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/core/Constants.hpp>
#include <astro/core/Log.hpp>
#include <astro/engine/Config.hpp>
#include <astro/engine/World.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace astro;

namespace {

constexpr core::u64 kDefaultTicks  = core::kTickRate * 60;
constexpr core::u64 kReportPeriod  = core::kTickRate * 5;

std::optional<core::u64> parseCount(const char *text)
{
    errno = 0;
    char *end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0')
        return std::nullopt;
    return static_cast<core::u64>(value);
}

/** @brief Small built-in catalogue standing in for an external debris feed. */
engine::AsteroidField::MetadataSource makeCatalogue(core::u64 seed)
{
    auto records = std::make_shared<std::vector<std::pair<core::u32, std::shared_ptr<const entity::DebrisRecord>>>>();
    records->emplace_back(25544u, std::make_shared<const entity::DebrisRecord>(
        entity::DebrisRecord{"ISS (ZARYA)", "PAYLOAD", "ISS", "1998-11-20"}));
    records->emplace_back(22675u, std::make_shared<const entity::DebrisRecord>(
        entity::DebrisRecord{"COSMOS 2251 DEB", "DEBRIS", "CIS", "1993-06-16"}));
    records->emplace_back(34454u, std::make_shared<const entity::DebrisRecord>(
        entity::DebrisRecord{"IRIDIUM 33 DEB", "DEBRIS", "US", "1997-09-14"}));
    records->emplace_back(29228u, std::make_shared<const entity::DebrisRecord>(
        entity::DebrisRecord{"FENGYUN 1C DEB", "DEBRIS", "PRC", "1999-05-10"}));

    auto rng = std::make_shared<math::Random>(seed ^ 0x9E3779B97F4A7C15ull);
    return [records, rng]() {
        const auto &[id, record] = (*records)[static_cast<std::size_t>(
            rng->uniformInt(0, static_cast<core::i32>(records->size()) - 1))];
        return entity::DebrisMetadata{id, record};
    };
}

/** @brief Spins slowly, fires whenever allowed and scans what drifts close. */
engine::PlayerIntent autopilot(const engine::World &world, core::u64 tick)
{
    engine::PlayerIntent intent;
    intent.turn   = ((tick / 180) % 2 == 0) ? 0.5f : -0.5f;
    intent.thrust = ((tick / 90) % 3 == 0) ? 0.3f : 0.0f;
    intent.fire   = true;
    intent.scan   = world.scanTarget() != nullptr || (tick % 240) < 200;
    return intent;
}

void printStats(const engine::WorldStats &stats, core::u64 deaths, core::u64 scans)
{
    std::printf("tick %6llu | asteroids %4zu (unpooled %3zu) | shots %3zu (unpooled %3zu) | "
                "pool A %zu/%zu/%zu | pool S %zu/%zu/%zu | grid %4zu bodies %4zu cells | "
                "deaths %llu scans %llu\n",
                static_cast<unsigned long long>(stats.tick),
                stats.liveAsteroids, stats.unpooledAsteroids,
                stats.liveShots, stats.unpooledShots,
                stats.asteroidPool.active, stats.asteroidPool.available, stats.asteroidPool.total,
                stats.shotPool.active, stats.shotPool.available, stats.shotPool.total,
                stats.gridEntities, stats.gridCells,
                static_cast<unsigned long long>(deaths),
                static_cast<unsigned long long>(scans));
}

} // namespace

int main(int argc, char **argv)
{
    core::u64 ticks = kDefaultTicks;
    core::u64 seed  = 0;

    if (argc > 3)
    {
        std::fprintf(stderr, "usage: %s [ticks] [seed]\n", argv[0]);
        return 2;
    }
    if (argc > 1)
    {
        const auto parsed = parseCount(argv[1]);
        if (!parsed)
        {
            core::Log::error("sim", std::string{"invalid tick count: "} + argv[1]);
            return 2;
        }
        ticks = *parsed;
    }
    if (argc > 2)
    {
        const auto parsed = parseCount(argv[2]);
        if (!parsed)
        {
            core::Log::error("sim", std::string{"invalid seed: "} + argv[2]);
            return 2;
        }
        seed = *parsed;
    }

    const engine::Config config = engine::Config::Builder{}.seed(seed).build();

    auto created = engine::World::create(config);
    if (!created)
    {
        core::Log::fatal("sim", created.error().format());
        return 1;
    }
    engine::World &world = **created;
    world.setMetadataSource(makeCatalogue(seed));

    core::u64 deaths = 0;
    core::u64 scans  = 0;
    core::u64 hits   = 0;
    core::u64 fragments = 0;

    for (core::u64 tick = 1; tick <= ticks; ++tick)
    {
        const auto report = world.step(core::kFixedDeltaTime, autopilot(world, tick));
        if (!report)
        {
            core::Log::fatal("sim", report.error().format());
            return 1;
        }

        hits      += report->shotHits;
        fragments += report->fragmentsSpawned;
        if (report->scan != engine::ScanResult::kNone)
            ++scans;
        if (report->playerHit)
        {
            ++deaths;
            world.respawnPlayer();
        }

        if (tick % kReportPeriod == 0)
            printStats(world.stats(), deaths, scans);
    }

    printStats(world.stats(), deaths, scans);
    std::printf("done: %llu ticks, %llu shot hits, %llu fragments, %llu deaths, %llu scans\n",
                static_cast<unsigned long long>(ticks),
                static_cast<unsigned long long>(hits),
                static_cast<unsigned long long>(fragments),
                static_cast<unsigned long long>(deaths),
                static_cast<unsigned long long>(scans));
    return 0;
}

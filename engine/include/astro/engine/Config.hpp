/**
 * @file Config.hpp
 * @brief Simulation configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENGINE_CONFIG_HPP
    #define ASTRO_ENGINE_CONFIG_HPP

#include <astro/core/Constants.hpp>
#include <astro/core/Expected.hpp>
#include <astro/core/Types.hpp>

namespace astro::engine {

/** @brief Immutable simulation configuration. */
class Config
{
public:
    class Builder;

    /** @brief kInvalidArgument naming the first out-of-range setting. */
    [[nodiscard]] core::ExpectedVoid validate() const;

    [[nodiscard]] core::f32   arenaWidth()          const noexcept { return _arenaWidth; }
    [[nodiscard]] core::f32   arenaHeight()         const noexcept { return _arenaHeight; }
    [[nodiscard]] core::f32   cellSize()            const noexcept { return _cellSize; }
    [[nodiscard]] core::f32   asteroidMinRadius()   const noexcept { return _asteroidMinRadius; }
    [[nodiscard]] core::u32   asteroidKinds()       const noexcept { return _asteroidKinds; }
    [[nodiscard]] core::f32   asteroidMaxRadius()   const noexcept { return _asteroidMinRadius * static_cast<core::f32>(_asteroidKinds); }
    [[nodiscard]] core::f32   asteroidMinSpeed()    const noexcept { return _asteroidMinSpeed; }
    [[nodiscard]] core::f32   asteroidMaxSpeed()    const noexcept { return _asteroidMaxSpeed; }
    [[nodiscard]] core::f32   spawnInterval()       const noexcept { return _spawnInterval; }
    [[nodiscard]] bool        spawnerEnabled()      const noexcept { return _spawnerEnabled; }
    [[nodiscard]] core::usize asteroidPoolInitial() const noexcept { return _asteroidPoolInitial; }
    [[nodiscard]] core::usize asteroidPoolMax()     const noexcept { return _asteroidPoolMax; }
    [[nodiscard]] core::usize shotPoolInitial()     const noexcept { return _shotPoolInitial; }
    [[nodiscard]] core::usize shotPoolMax()         const noexcept { return _shotPoolMax; }
    [[nodiscard]] bool        usePools()            const noexcept { return _usePools; }
    [[nodiscard]] core::f32   shotRadius()          const noexcept { return _shotRadius; }
    [[nodiscard]] core::f32   shotLifetime()        const noexcept { return _shotLifetime; }
    [[nodiscard]] core::f32   shotSpeed()           const noexcept { return _shotSpeed; }
    [[nodiscard]] core::f32   shotCooldown()        const noexcept { return _shotCooldown; }
    [[nodiscard]] core::f32   playerRadius()        const noexcept { return _playerRadius; }
    [[nodiscard]] core::f32   playerSpeed()         const noexcept { return _playerSpeed; }
    [[nodiscard]] core::f32   playerTurnSpeed()     const noexcept { return _playerTurnSpeed; }
    [[nodiscard]] core::f32   splitSpeedScale()     const noexcept { return _splitSpeedScale; }
    [[nodiscard]] core::f32   splitMinAngleDeg()    const noexcept { return _splitMinAngleDeg; }
    [[nodiscard]] core::f32   splitMaxAngleDeg()    const noexcept { return _splitMaxAngleDeg; }
    [[nodiscard]] core::f32   scanRange()           const noexcept { return _scanRange; }
    [[nodiscard]] core::f32   scanQuickTime()       const noexcept { return _scanQuickTime; }
    [[nodiscard]] core::f32   scanFullTime()        const noexcept { return _scanFullTime; }
    [[nodiscard]] core::u64   seed()                const noexcept { return _seed; }

private:
    friend class Builder;

    core::f32   _arenaWidth{core::kArenaWidth};
    core::f32   _arenaHeight{core::kArenaHeight};
    core::f32   _cellSize{core::kCellSize};
    core::f32   _asteroidMinRadius{core::kAsteroidMinRadius};
    core::u32   _asteroidKinds{core::kAsteroidKinds};
    core::f32   _asteroidMinSpeed{core::kAsteroidMinSpeed};
    core::f32   _asteroidMaxSpeed{core::kAsteroidMaxSpeed};
    core::f32   _spawnInterval{core::kAsteroidSpawnInterval};
    bool        _spawnerEnabled{true};
    core::usize _asteroidPoolInitial{core::kAsteroidPoolInitial};
    core::usize _asteroidPoolMax{core::kAsteroidPoolMax};
    core::usize _shotPoolInitial{core::kShotPoolInitial};
    core::usize _shotPoolMax{core::kShotPoolMax};
    bool        _usePools{true};
    core::f32   _shotRadius{core::kShotRadius};
    core::f32   _shotLifetime{core::kShotLifetime};
    core::f32   _shotSpeed{core::kShotSpeed};
    core::f32   _shotCooldown{core::kShotCooldown};
    core::f32   _playerRadius{core::kPlayerRadius};
    core::f32   _playerSpeed{core::kPlayerSpeed};
    core::f32   _playerTurnSpeed{core::kPlayerTurnSpeed};
    core::f32   _splitSpeedScale{core::kSplitSpeedScale};
    core::f32   _splitMinAngleDeg{core::kSplitMinAngleDeg};
    core::f32   _splitMaxAngleDeg{core::kSplitMaxAngleDeg};
    core::f32   _scanRange{core::kScanRange};
    core::f32   _scanQuickTime{core::kScanQuickTime};
    core::f32   _scanFullTime{core::kScanFullTime};
    core::u64   _seed{0};
};

/** @brief Fluent builder for Config. */
class Config::Builder
{
public:
    Builder& arenaSize(core::f32 width, core::f32 height) noexcept;
    Builder& cellSize(core::f32 size) noexcept;
    Builder& asteroidMinRadius(core::f32 radius) noexcept;
    Builder& asteroidKinds(core::u32 kinds) noexcept;
    Builder& asteroidSpeedRange(core::f32 min, core::f32 max) noexcept;
    Builder& spawnInterval(core::f32 seconds) noexcept;
    Builder& enableSpawner(bool enabled) noexcept;
    Builder& asteroidPool(core::usize initial, core::usize maxSize) noexcept;
    Builder& shotPool(core::usize initial, core::usize maxSize) noexcept;
    Builder& usePools(bool enabled) noexcept;
    Builder& shotRadius(core::f32 radius) noexcept;
    Builder& shotLifetime(core::f32 seconds) noexcept;
    Builder& shotSpeed(core::f32 speed) noexcept;
    Builder& shotCooldown(core::f32 seconds) noexcept;
    Builder& playerRadius(core::f32 radius) noexcept;
    Builder& playerSpeed(core::f32 speed) noexcept;
    Builder& playerTurnSpeed(core::f32 degreesPerSecond) noexcept;
    Builder& splitSpeedScale(core::f32 scale) noexcept;
    Builder& splitAngleRange(core::f32 minDeg, core::f32 maxDeg) noexcept;
    Builder& scanRange(core::f32 range) noexcept;
    Builder& scanTimes(core::f32 quick, core::f32 full) noexcept;
    Builder& seed(core::u64 value) noexcept;

    [[nodiscard]] Config build() const noexcept { return _config; }

private:
    Config _config;
};

} // namespace astro::engine

#endif // ASTRO_ENGINE_CONFIG_HPP

/**
 * @file Config.cpp
 * @brief Config::Builder and validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/engine/Config.hpp>

#include <string>

namespace astro::engine {

Config::Builder& Config::Builder::arenaSize(core::f32 width, core::f32 height) noexcept
{
    _config._arenaWidth  = width;
    _config._arenaHeight = height;
    return *this;
}

Config::Builder& Config::Builder::cellSize(core::f32 size) noexcept
{
    _config._cellSize = size;
    return *this;
}

Config::Builder& Config::Builder::asteroidMinRadius(core::f32 radius) noexcept
{
    _config._asteroidMinRadius = radius;
    return *this;
}

Config::Builder& Config::Builder::asteroidKinds(core::u32 kinds) noexcept
{
    _config._asteroidKinds = kinds;
    return *this;
}

Config::Builder& Config::Builder::asteroidSpeedRange(core::f32 min, core::f32 max) noexcept
{
    _config._asteroidMinSpeed = min;
    _config._asteroidMaxSpeed = max;
    return *this;
}

Config::Builder& Config::Builder::spawnInterval(core::f32 seconds) noexcept
{
    _config._spawnInterval = seconds;
    return *this;
}

Config::Builder& Config::Builder::enableSpawner(bool enabled) noexcept
{
    _config._spawnerEnabled = enabled;
    return *this;
}

Config::Builder& Config::Builder::asteroidPool(core::usize initial, core::usize maxSize) noexcept
{
    _config._asteroidPoolInitial = initial;
    _config._asteroidPoolMax     = maxSize;
    return *this;
}

Config::Builder& Config::Builder::shotPool(core::usize initial, core::usize maxSize) noexcept
{
    _config._shotPoolInitial = initial;
    _config._shotPoolMax     = maxSize;
    return *this;
}

Config::Builder& Config::Builder::usePools(bool enabled) noexcept
{
    _config._usePools = enabled;
    return *this;
}

Config::Builder& Config::Builder::shotRadius(core::f32 radius) noexcept
{
    _config._shotRadius = radius;
    return *this;
}

Config::Builder& Config::Builder::shotLifetime(core::f32 seconds) noexcept
{
    _config._shotLifetime = seconds;
    return *this;
}

Config::Builder& Config::Builder::shotSpeed(core::f32 speed) noexcept
{
    _config._shotSpeed = speed;
    return *this;
}

Config::Builder& Config::Builder::shotCooldown(core::f32 seconds) noexcept
{
    _config._shotCooldown = seconds;
    return *this;
}

Config::Builder& Config::Builder::playerRadius(core::f32 radius) noexcept
{
    _config._playerRadius = radius;
    return *this;
}

Config::Builder& Config::Builder::playerSpeed(core::f32 speed) noexcept
{
    _config._playerSpeed = speed;
    return *this;
}

Config::Builder& Config::Builder::playerTurnSpeed(core::f32 degreesPerSecond) noexcept
{
    _config._playerTurnSpeed = degreesPerSecond;
    return *this;
}

Config::Builder& Config::Builder::splitSpeedScale(core::f32 scale) noexcept
{
    _config._splitSpeedScale = scale;
    return *this;
}

Config::Builder& Config::Builder::splitAngleRange(core::f32 minDeg, core::f32 maxDeg) noexcept
{
    _config._splitMinAngleDeg = minDeg;
    _config._splitMaxAngleDeg = maxDeg;
    return *this;
}

Config::Builder& Config::Builder::scanRange(core::f32 range) noexcept
{
    _config._scanRange = range;
    return *this;
}

Config::Builder& Config::Builder::scanTimes(core::f32 quick, core::f32 full) noexcept
{
    _config._scanQuickTime = quick;
    _config._scanFullTime  = full;
    return *this;
}

Config::Builder& Config::Builder::seed(core::u64 value) noexcept
{
    _config._seed = value;
    return *this;
}

namespace {

core::ExpectedVoid invalid(const char *what)
{
    return core::makeError(core::ErrorCode::kInvalidArgument, std::string{"config: "} + what);
}

} // namespace

core::ExpectedVoid Config::validate() const
{
    if (!(_arenaWidth > 0.0f) || !(_arenaHeight > 0.0f))
        return invalid("arena size must be > 0");
    if (!(_cellSize > 0.0f))
        return invalid("cell size must be > 0");
    if (!(_asteroidMinRadius > 0.0f) || _asteroidKinds == 0)
        return invalid("asteroid min radius must be > 0 and kinds >= 1");
    if (_asteroidMinSpeed < 0.0f || _asteroidMinSpeed > _asteroidMaxSpeed)
        return invalid("asteroid speed range must satisfy 0 <= min <= max");
    if (_spawnerEnabled && !(_spawnInterval > 0.0f))
        return invalid("spawn interval must be > 0");
    if (_usePools && (_asteroidPoolMax == 0 || _asteroidPoolInitial > _asteroidPoolMax))
        return invalid("asteroid pool needs 0 < maxSize and initial <= maxSize");
    if (_usePools && (_shotPoolMax == 0 || _shotPoolInitial > _shotPoolMax))
        return invalid("shot pool needs 0 < maxSize and initial <= maxSize");
    if (_shotRadius < 0.0f || !(_shotLifetime > 0.0f) || _shotCooldown < 0.0f)
        return invalid("shot radius/cooldown must be >= 0 and lifetime > 0");
    if (_playerRadius < 0.0f)
        return invalid("player radius must be >= 0");
    if (_splitMinAngleDeg > _splitMaxAngleDeg)
        return invalid("split angle range must satisfy min <= max");
    if (_scanRange < 0.0f || _scanQuickTime < 0.0f || _scanQuickTime > _scanFullTime)
        return invalid("scan times must satisfy 0 <= quick <= full");
    return {};
}

} // namespace astro::engine

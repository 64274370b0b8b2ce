/**
 * @file Constants.hpp
 * @brief Simulation-wide compile-time defaults.
 *
 * Every tunable of the arena, the spawner, the pools and the broad
 * phase has its default here; engine::Config::Builder starts from these
 * values.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_CORE_CONSTANTS_HPP
    #define ASTRO_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace astro::core {

inline constexpr u32   kTickRate                 = 60;
inline constexpr f32   kFixedDeltaTime           = 1.0f / static_cast<f32>(kTickRate);

inline constexpr f32   kArenaWidth               = 1280.0f;
inline constexpr f32   kArenaHeight              = 720.0f;

inline constexpr f32   kAsteroidMinRadius        = 20.0f;
inline constexpr u32   kAsteroidKinds            = 3;
inline constexpr f32   kAsteroidMaxRadius        = kAsteroidMinRadius * kAsteroidKinds;
inline constexpr f32   kAsteroidSpawnInterval    = 0.8f;
inline constexpr f32   kAsteroidMinSpeed         = 40.0f;
inline constexpr f32   kAsteroidMaxSpeed         = 100.0f;
inline constexpr i32   kAsteroidSpawnSpreadDeg   = 30;

inline constexpr f32   kSplitSpeedScale          = 1.2f;
inline constexpr f32   kSplitMinAngleDeg         = 20.0f;
inline constexpr f32   kSplitMaxAngleDeg         = 50.0f;

inline constexpr f32   kShotRadius               = 5.0f;
inline constexpr f32   kShotLifetime             = 2.0f;
inline constexpr f32   kShotSpeed                = 500.0f;
inline constexpr f32   kShotCooldown             = 0.3f;

inline constexpr f32   kPlayerRadius             = 20.0f;
inline constexpr f32   kPlayerSpeed              = 200.0f;
inline constexpr f32   kPlayerTurnSpeed          = 300.0f;

inline constexpr f32   kScanRange                = 150.0f;
inline constexpr f32   kScanQuickTime            = 1.0f;
inline constexpr f32   kScanFullTime             = 3.0f;

inline constexpr f32   kCellSize                 = kAsteroidMaxRadius * 2.0f + 32.0f;

inline constexpr usize kAsteroidPoolInitial      = 100;
inline constexpr usize kAsteroidPoolMax          = 500;
inline constexpr usize kShotPoolInitial          = 50;
inline constexpr usize kShotPoolMax              = 200;

} // namespace astro::core

#endif // ASTRO_CORE_CONSTANTS_HPP

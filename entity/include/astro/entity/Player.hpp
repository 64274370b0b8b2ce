/**
 * @file Player.hpp
 * @brief The ship.  Never pooled; owned directly by the World.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_PLAYER_HPP
    #define ASTRO_ENTITY_PLAYER_HPP

    #include <astro/physics/CircleBody.hpp>
    #include <astro/core/Constants.hpp>

namespace astro::entity {

class Player final : public physics::CircleBody {
public:
    static constexpr physics::BodyKind kKind = physics::BodyKind::kPlayer;

    Player(math::Vec2f position, core::f32 radius = core::kPlayerRadius) noexcept;

    /** @brief Heading in degrees; 0 points along +Y. */
    [[nodiscard]] core::f32   rotation() const noexcept { return _rotation; }
    [[nodiscard]] math::Vec2f forward()  const noexcept;

    /** @brief Rotates by @p degreesPerSecond * @p dt (negative turns the other way). */
    void turn(core::f32 degreesPerSecond, core::f32 dt) noexcept;

    /** @brief Moves along the heading by @p speed * @p dt (negative backs up). */
    void thrust(core::f32 speed, core::f32 dt) noexcept;

    /** @brief Counts the fire cooldown down by @p dt. */
    void tickCooldown(core::f32 dt) noexcept;

    /**
     * @brief Consumes the cooldown if it has elapsed.
     * @return true if the player may fire now; the cooldown restarts at @p cooldown.
     */
    bool tryFire(core::f32 cooldown) noexcept;

    [[nodiscard]] core::f32 cooldownRemaining() const noexcept { return _shootTimer; }

    /** @brief Puts the ship back at @p position, alive, facing +Y. */
    void respawn(math::Vec2f position) noexcept;

private:
    core::f32 _rotation{0.0f};
    core::f32 _shootTimer{0.0f};
};

} // namespace astro::entity

#endif // ASTRO_ENTITY_PLAYER_HPP

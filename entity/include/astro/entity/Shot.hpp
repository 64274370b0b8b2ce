/**
 * @file Shot.hpp
 * @brief Short-lived projectile fired by the player.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_SHOT_HPP
    #define ASTRO_ENTITY_SHOT_HPP

    #include <astro/physics/CircleBody.hpp>
    #include <astro/core/Constants.hpp>

namespace astro::entity {

class Shot final : public physics::CircleBody {
public:
    static constexpr physics::BodyKind kKind = physics::BodyKind::kShot;

    struct Params
    {
        math::Vec2f position{};
        core::f32   radius{core::kShotRadius};
        core::f32   maxLifetime{core::kShotLifetime};
    };

    explicit Shot(const Params &params);

    /** @brief Reinitialises position, radius and lifetime; velocity is zeroed. */
    void reset(const Params &params);

    /** @brief Moves the shot and ages it by @p dt (no-op when dead). */
    void update(core::f32 dt) noexcept;

    [[nodiscard]] bool      isExpired()   const noexcept { return _lifetime >= _maxLifetime; }
    [[nodiscard]] core::f32 lifetime()    const noexcept { return _lifetime; }
    [[nodiscard]] core::f32 maxLifetime() const noexcept { return _maxLifetime; }

private:
    core::f32 _lifetime{0.0f};
    core::f32 _maxLifetime;
};

} // namespace astro::entity

#endif // ASTRO_ENTITY_SHOT_HPP

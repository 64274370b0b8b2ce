/**
 * @file CircleBody.hpp
 * @brief Circular collidable: the state every broad-phase participant exposes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_PHYSICS_CIRCLEBODY_HPP
    #define ASTRO_PHYSICS_CIRCLEBODY_HPP

#include <astro/math/Vec2.hpp>
#include <astro/core/Types.hpp>

#include <string_view>

namespace astro::physics {

/**
 * @brief Discriminator used to filter query candidates.
 */
enum class BodyKind : core::u8 {
    kAsteroid = 0,
    kShot,
    kPlayer
};

[[nodiscard]] std::string_view bodyKindName(BodyKind kind) noexcept;

/**
 * @class CircleBody
 * @brief Position, velocity, radius, liveness and kind of one entity.
 *
 * A dead body may still be allocated (pooled) but is logically absent:
 * it is never inserted into an index and callers skip it in query
 * results.
 */
class CircleBody
{
public:
    virtual ~CircleBody() = default;

    [[nodiscard]] BodyKind    kind()     const noexcept { return _kind; }
    [[nodiscard]] math::Vec2f position() const noexcept { return _position; }
    [[nodiscard]] math::Vec2f velocity() const noexcept { return _velocity; }
    [[nodiscard]] core::f32   radius()   const noexcept { return _radius; }
    [[nodiscard]] bool        isAlive()  const noexcept { return _alive; }

    void setPosition(math::Vec2f position) noexcept { _position = position; }
    void setVelocity(math::Vec2f velocity) noexcept { _velocity = velocity; }

    /** @brief Marks the body logically absent. */
    void markDead() noexcept { _alive = false; }

    /** @brief Integrates position over @p dt (no-op when dead). */
    void advance(core::f32 dt) noexcept;

    /** @brief Exact circle-circle overlap (touching counts). */
    [[nodiscard]] bool collidesWith(const CircleBody &other) const noexcept;

protected:
    CircleBody(BodyKind kind, math::Vec2f position, core::f32 radius) noexcept;

    math::Vec2f _position{};
    math::Vec2f _velocity{};
    core::f32   _radius{0.0f};
    bool        _alive{true};

private:
    BodyKind    _kind;
};

} // namespace astro::physics

#endif // ASTRO_PHYSICS_CIRCLEBODY_HPP

/**
 * @file Poolable.hpp
 * @brief Capability required from every entity kind managed by a Lifecycle.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_POOLABLE_HPP
    #define ASTRO_ENTITY_POOLABLE_HPP

    #include <astro/physics/CircleBody.hpp>

    #include <concepts>
    #include <utility>

namespace astro::entity {

/**
 * @brief An entity kind that can be recycled.
 *
 * - `T::Params` carries everything needed to (re)initialise an instance;
 * - `T(params)` builds a fresh instance, `reset(params)` overwrites every
 *   field of a stale one;
 * - `T::kKind` is the body discriminator of the kind.
 */
template <typename T>
concept Poolable = std::derived_from<T, physics::CircleBody>
    && std::constructible_from<T, const typename T::Params &>
    && requires(T &entity, const T &cref, const typename T::Params &params) {
        { T::kKind } -> std::convertible_to<physics::BodyKind>;
        { entity.reset(params) };
        { entity.markDead() };
        { cref.isAlive() } -> std::convertible_to<bool>;
    };

/**
 * @brief Downcasts a query candidate after checking its discriminator.
 * @return nullptr when @p body is null or of another kind.
 */
template <Poolable T>
[[nodiscard]] T *bodyCast(physics::CircleBody *body) noexcept
{
    if (!body || body->kind() != T::kKind)
        return nullptr;
    return static_cast<T *>(body);
}

} // namespace astro::entity

#endif // ASTRO_ENTITY_POOLABLE_HPP

/**
 * @file Vec2.hpp
 * @brief 2-component vector template for arena positions and velocities.
 *
 * @tparam T Scalar type satisfying astro::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_MATH_VEC2_HPP
    #define ASTRO_MATH_VEC2_HPP

    #include <astro/core/Concepts.hpp>

namespace astro::math {

template <core::Arithmetic T>
struct Vec2 final {
    T x{};
    T y{};

    constexpr Vec2() = default;
    constexpr Vec2(T x, T y);

    [[nodiscard]] constexpr Vec2 operator+(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator-(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator-()          const;

    constexpr Vec2 &operator+=(Vec2 rhs);
    constexpr Vec2 &operator-=(Vec2 rhs);
    constexpr Vec2 &operator*=(T scalar);

    [[nodiscard]] constexpr bool operator==(const Vec2 &rhs) const = default;

    [[nodiscard]] constexpr T dot(Vec2 rhs)              const;
    [[nodiscard]] constexpr T lengthSquared()            const;
    [[nodiscard]] constexpr T distanceSquared(Vec2 rhs)  const;
    [[nodiscard]] T           length()                   const;
    [[nodiscard]] T           distance(Vec2 rhs)         const;
    [[nodiscard]] Vec2        normalize()                const;

    /**
     * @brief Counter-clockwise rotation.
     * @param degrees Angle in degrees (negative rotates clockwise).
     */
    [[nodiscard]] Vec2 rotated(T degrees) const;

    static constexpr Vec2 zero();
    static constexpr Vec2 unitX();
    static constexpr Vec2 unitY();
};

using Vec2f = Vec2<float>;
using Vec2d = Vec2<double>;

} // namespace astro::math

    #include "Vec2.inl"

#endif // ASTRO_MATH_VEC2_HPP

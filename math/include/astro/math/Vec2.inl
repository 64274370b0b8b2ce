/**
 * @file Vec2.inl
 * @brief Inline implementation of Vec2 operations.
 * @see   Vec2.hpp
 */

#ifndef ASTRO_MATH_VEC2_INL
    #define ASTRO_MATH_VEC2_INL

#include <cmath>
#include <numbers>

namespace astro::math {

template <core::Arithmetic T>
constexpr Vec2<T>::Vec2(T x_, T y_) : x(x_), y(y_) {}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator+(Vec2 rhs) const { return {x + rhs.x, y + rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-(Vec2 rhs) const { return {x - rhs.x, y - rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator*(T s) const { return {x * s, y * s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator/(T s) const { return {x / s, y / s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-() const { return {-x, -y}; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator+=(Vec2 rhs) { x += rhs.x; y += rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator-=(Vec2 rhs) { x -= rhs.x; y -= rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator*=(T s) { x *= s; y *= s; return *this; }

template <core::Arithmetic T>
constexpr T Vec2<T>::dot(Vec2 rhs) const { return x * rhs.x + y * rhs.y; }

template <core::Arithmetic T>
constexpr T Vec2<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
constexpr T Vec2<T>::distanceSquared(Vec2 rhs) const { return (*this - rhs).lengthSquared(); }

template <core::Arithmetic T>
T Vec2<T>::length() const { return static_cast<T>(std::sqrt(lengthSquared())); }

template <core::Arithmetic T>
T Vec2<T>::distance(Vec2 rhs) const { return (*this - rhs).length(); }

template <core::Arithmetic T>
Vec2<T> Vec2<T>::normalize() const
{
    const T len = length();
    if (len == T{})
        return zero();
    return *this / len;
}

template <core::Arithmetic T>
Vec2<T> Vec2<T>::rotated(T degrees) const
{
    const auto radians = static_cast<double>(degrees) * std::numbers::pi / 180.0;
    const auto c = std::cos(radians);
    const auto s = std::sin(radians);
    return {
        static_cast<T>(static_cast<double>(x) * c - static_cast<double>(y) * s),
        static_cast<T>(static_cast<double>(x) * s + static_cast<double>(y) * c)
    };
}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::zero()  { return {T{}, T{}}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::unitX() { return {T{1}, T{}}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::unitY() { return {T{}, T{1}}; }

} // namespace astro::math

#endif // ASTRO_MATH_VEC2_INL

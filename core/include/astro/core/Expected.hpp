/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * ASTRO_TRY / ASTRO_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_CORE_EXPECTED_HPP
    #define ASTRO_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace astro::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace astro::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type astro::core::Expected<U>.
 */
#define ASTRO_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_astro_result = (expr);                                     \
        if (!_astro_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_astro_result.error()));       \
        std::move(_astro_result.value());                                  \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type astro::core::ExpectedVoid.
 */
#define ASTRO_TRY_VOID(expr)                                              \
    do {                                                                    \
        auto &&_astro_result = (expr);                                     \
        if (!_astro_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_astro_result.error()));       \
    } while (false)

#endif // ASTRO_CORE_EXPECTED_HPP

/**
 * @file CellKey.hpp
 * @brief Integer grid cell coordinate and its hash.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_PHYSICS_CELLKEY_HPP
    #define ASTRO_PHYSICS_CELLKEY_HPP

#include <astro/core/Types.hpp>

#include <cstddef>
#include <functional>

namespace astro::physics {

/**
 * @struct CellKey
 * @brief (floor(x / cellSize), floor(y / cellSize)).  May be negative.
 */
struct CellKey
{
    core::i32 x{0};
    core::i32 y{0};

    [[nodiscard]] constexpr bool operator==(const CellKey &) const noexcept = default;

    /**
     * @brief Maps a world coordinate to its cell.
     *
     * Coordinates beyond ±2^30 cells saturate; NaN maps to cell 0.
     */
    [[nodiscard]] static CellKey fromPosition(core::f32 x, core::f32 y, core::f32 cellSize) noexcept;
};

/**
 * @struct CellKeyHash
 * @brief Mixes both axes so that neighbouring cells spread over buckets.
 */
struct CellKeyHash
{
    [[nodiscard]] std::size_t operator()(const CellKey &key) const noexcept
    {
        auto h = static_cast<core::u64>(static_cast<core::u32>(key.x));
        h ^= static_cast<core::u64>(static_cast<core::u32>(key.y)) * 0x9E3779B97F4A7C15ULL;
        return static_cast<std::size_t>(h ^ (h >> 29));
    }
};

/**
 * @struct CellRange
 * @brief Inclusive rectangle of cells.
 */
struct CellRange
{
    CellKey min{};
    CellKey max{};

    /** @brief Grows the range by @p ring cells on every side. */
    [[nodiscard]] constexpr CellRange expanded(core::i32 ring) const noexcept
    {
        return {{min.x - ring, min.y - ring}, {max.x + ring, max.y + ring}};
    }

    [[nodiscard]] constexpr core::usize cellCount() const noexcept
    {
        return static_cast<core::usize>(max.x - min.x + 1) * static_cast<core::usize>(max.y - min.y + 1);
    }
};

} // namespace astro::physics

#endif // ASTRO_PHYSICS_CELLKEY_HPP

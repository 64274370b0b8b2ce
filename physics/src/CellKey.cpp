/**
 * @file CellKey.cpp
 * @brief World-to-cell mapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/physics/CellKey.hpp>

#include <algorithm>
#include <cmath>

namespace astro::physics {

namespace {

constexpr core::f64 kCellLimit = static_cast<core::f64>(1 << 30);

core::i32 toCellCoord(core::f32 v, core::f32 cellSize) noexcept
{
    const core::f64 c = std::floor(static_cast<core::f64>(v) / static_cast<core::f64>(cellSize));
    if (std::isnan(c))
    {
        return 0;
    }
    return static_cast<core::i32>(std::clamp(c, -kCellLimit, kCellLimit));
}

} // anonymous namespace

CellKey CellKey::fromPosition(core::f32 x, core::f32 y, core::f32 cellSize) noexcept
{
    return {toCellCoord(x, cellSize), toCellCoord(y, cellSize)};
}

} // namespace astro::physics

/**
 * @file SpatialGrid.hpp
 * @brief Uniform spatial hash grid for broad-phase collision.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_PHYSICS_SPATIALGRID_HPP
    #define ASTRO_PHYSICS_SPATIALGRID_HPP

#include <astro/physics/ISpatialIndex.hpp>
#include <astro/physics/CellKey.hpp>
#include <astro/core/Expected.hpp>
#include <astro/core/NonCopyable.hpp>

#include <memory>
#include <optional>

namespace astro::physics {

/**
 * @class SpatialGrid
 * @brief Lazily populated square-cell hash grid.
 *
 * A body is appended to every cell its bounding square (position ±
 * radius) overlaps.  Queries scan the overlapped cells of the anchor
 * plus one ring of neighbours, so two overlapping bodies always see
 * each other provided cellSize >= 2 * the largest inserted radius.
 * That precondition is documented, not checked.
 *
 * O(1) insert for radius << cellSize, O(k) query.
 */
class SpatialGrid final : public ISpatialIndex,
                          private core::NonCopyable<SpatialGrid>
{
public:
    /**
     * @brief Builds an empty grid.
     * @param cellSize Side length of each square cell (> 0).
     * @return The grid, or kInvalidArgument when cellSize is not positive.
     */
    [[nodiscard]] static core::Expected<SpatialGrid> create(core::f32 cellSize);

    SpatialGrid(SpatialGrid &&) noexcept;
    SpatialGrid &operator=(SpatialGrid &&) noexcept;
    ~SpatialGrid() override;

    using ISpatialIndex::query;
    using ISpatialIndex::queryPoint;
    using ISpatialIndex::queryRect;

    void clear() override;

    void insert(CircleBody &body) override;

    void query(const CircleBody &body, const Visitor &visitor) const override;

    void queryPoint(core::f32 x, core::f32 y, core::f32 radius,
                    const Visitor &visitor) const override;

    void queryRect(core::f32 x1, core::f32 y1, core::f32 x2, core::f32 y2,
                   const Visitor &visitor) const override;

    [[nodiscard]] core::usize entityCount() const noexcept override;
    [[nodiscard]] core::usize cellCount() const noexcept override;

    [[nodiscard]] core::f32 cellSize() const noexcept;

    /** @brief Minimum cell of @p body's bounding square, if inserted (diagnostic). */
    [[nodiscard]] std::optional<CellKey> primaryCell(const CircleBody &body) const;

    /** @brief Bodies currently stored in @p cell (diagnostic). */
    [[nodiscard]] core::usize cellOccupancy(CellKey cell) const;

private:
    explicit SpatialGrid(core::f32 cellSize);

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace astro::physics

#endif // ASTRO_PHYSICS_SPATIALGRID_HPP

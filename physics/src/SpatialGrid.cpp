/**
 * @file SpatialGrid.cpp
 * @brief Uniform spatial hash grid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/physics/SpatialGrid.hpp>
#include <astro/core/Log.hpp>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace astro::physics {

struct SpatialGrid::Impl
{
    core::f32                                                     cellSize;
    std::unordered_map<CellKey, std::vector<CircleBody *>, CellKeyHash> cells;
    std::unordered_map<const CircleBody *, CellKey>                primaryCells;

    explicit Impl(core::f32 cs) : cellSize{cs} {}

    [[nodiscard]] CellRange coveredCells(core::f32 minX, core::f32 minY,
                                         core::f32 maxX, core::f32 maxY) const noexcept
    {
        return {CellKey::fromPosition(minX, minY, cellSize),
                CellKey::fromPosition(maxX, maxY, cellSize)};
    }

    [[nodiscard]] CellRange coveredCells(const CircleBody &body) const noexcept
    {
        const auto p = body.position();
        const auto r = body.radius();
        return coveredCells(p.x - r, p.y - r, p.x + r, p.y + r);
    }

    /**
     * Visits every distinct body stored in @p range plus one ring of
     * neighbours.  The union of the 3x3 blocks around each cell of a
     * rectangle is the rectangle grown by one, so each cell is read once.
     */
    void scan(CellRange range, const CircleBody *exclude, const Visitor &visitor) const
    {
        const CellRange scanned = range.expanded(1);

        std::unordered_set<const CircleBody *> seen;
        if (exclude)
        {
            seen.insert(exclude);
        }

        for (core::i32 cx = scanned.min.x; cx <= scanned.max.x; ++cx)
        {
            for (core::i32 cy = scanned.min.y; cy <= scanned.max.y; ++cy)
            {
                auto it = cells.find(CellKey{cx, cy});
                if (it == cells.end())
                {
                    continue;
                }

                for (CircleBody *body : it->second)
                {
                    if (seen.insert(body).second)
                    {
                        visitor(*body);
                    }
                }
            }
        }
    }
};

SpatialGrid::SpatialGrid(core::f32 cellSize)
    : _impl{std::make_unique<Impl>(cellSize)}
{}

SpatialGrid::SpatialGrid(SpatialGrid &&) noexcept = default;
SpatialGrid &SpatialGrid::operator=(SpatialGrid &&) noexcept = default;
SpatialGrid::~SpatialGrid() = default;

core::Expected<SpatialGrid> SpatialGrid::create(core::f32 cellSize)
{
    if (!(cellSize > 0.0f))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "SpatialGrid: cell size must be positive, got " + std::to_string(cellSize));
    }

    core::Log::debug("GRID", "created with cell size " + std::to_string(cellSize));
    return SpatialGrid{cellSize};
}

void SpatialGrid::clear()
{
    _impl->cells.clear();
    _impl->primaryCells.clear();
}

void SpatialGrid::insert(CircleBody &body)
{
    const CellRange range = _impl->coveredCells(body);

    for (core::i32 cx = range.min.x; cx <= range.max.x; ++cx)
    {
        for (core::i32 cy = range.min.y; cy <= range.max.y; ++cy)
        {
            _impl->cells[CellKey{cx, cy}].push_back(&body);
        }
    }

    _impl->primaryCells.insert_or_assign(&body, range.min);
}

void SpatialGrid::query(const CircleBody &body, const Visitor &visitor) const
{
    _impl->scan(_impl->coveredCells(body), &body, visitor);
}

void SpatialGrid::queryPoint(core::f32 x, core::f32 y, core::f32 radius,
                             const Visitor &visitor) const
{
    const core::f32 r = std::max(radius, 0.0f);
    _impl->scan(_impl->coveredCells(x - r, y - r, x + r, y + r), nullptr, visitor);
}

void SpatialGrid::queryRect(core::f32 x1, core::f32 y1, core::f32 x2, core::f32 y2,
                            const Visitor &visitor) const
{
    _impl->scan(_impl->coveredCells(std::min(x1, x2), std::min(y1, y2),
                                    std::max(x1, x2), std::max(y1, y2)),
                nullptr, visitor);
}

core::usize SpatialGrid::entityCount() const noexcept
{
    return _impl->primaryCells.size();
}

core::usize SpatialGrid::cellCount() const noexcept
{
    return _impl->cells.size();
}

core::f32 SpatialGrid::cellSize() const noexcept
{
    return _impl->cellSize;
}

std::optional<CellKey> SpatialGrid::primaryCell(const CircleBody &body) const
{
    const auto it = _impl->primaryCells.find(&body);
    if (it == _impl->primaryCells.end())
    {
        return std::nullopt;
    }
    return it->second;
}

core::usize SpatialGrid::cellOccupancy(CellKey cell) const
{
    const auto it = _impl->cells.find(cell);
    return it == _impl->cells.end() ? 0 : it->second.size();
}

} // namespace astro::physics

/**
 * @file BruteForceIndex.hpp
 * @brief Linear-scan spatial index: the O(n) reference for SpatialGrid.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_PHYSICS_BRUTEFORCEINDEX_HPP
    #define ASTRO_PHYSICS_BRUTEFORCEINDEX_HPP

#include <astro/physics/ISpatialIndex.hpp>

#include <vector>

namespace astro::physics {

/**
 * @class BruteForceIndex
 * @brief Tests every inserted body's bounding square against the query box.
 *
 * Yields exactly the bodies whose bounding squares overlap the anchor's,
 * which is the smallest candidate set any broad phase may return.
 */
class BruteForceIndex final : public ISpatialIndex
{
public:
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

    [[nodiscard]] core::usize entityCount() const noexcept override { return _bodies.size(); }
    [[nodiscard]] core::usize cellCount() const noexcept override { return _bodies.empty() ? 0 : 1; }

private:
    void scan(core::f32 minX, core::f32 minY, core::f32 maxX, core::f32 maxY,
              const CircleBody *exclude, const Visitor &visitor) const;

    std::vector<CircleBody *> _bodies;
};

} // namespace astro::physics

#endif // ASTRO_PHYSICS_BRUTEFORCEINDEX_HPP

/**
 * @file ISpatialIndex.hpp
 * @brief Abstract spatial index interface for broad-phase queries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_PHYSICS_ISPATIALINDEX_HPP
    #define ASTRO_PHYSICS_ISPATIALINDEX_HPP

#include <astro/physics/CircleBody.hpp>
#include <astro/core/Types.hpp>

#include <functional>
#include <vector>

namespace astro::physics {

/**
 * @class ISpatialIndex
 * @brief Strategy interface for per-step broad-phase structures.
 *
 * The index holds non-owning references and no memory of previous
 * steps: every step calls clear() and re-inserts the live bodies before
 * issuing any query.  Queries return candidates in unspecified order,
 * each distinct body at most once; callers filter by kind and
 * liveness and run the narrow phase themselves.
 *
 * Concrete implementations: @c SpatialGrid, @c BruteForceIndex.
 */
class ISpatialIndex
{
public:
    /** @brief Receives one candidate per call. */
    using Visitor = std::function<void(CircleBody &)>;

    virtual ~ISpatialIndex() = default;

    /** @brief Forgets every inserted body. */
    virtual void clear() = 0;

    /** @brief Registers @p body for the current step. */
    virtual void insert(CircleBody &body) = 0;

    /** @brief Visits the candidates near @p body, never @p body itself. */
    virtual void query(const CircleBody &body, const Visitor &visitor) const = 0;

    /** @brief Visits the candidates near the point (x, y), widened by @p radius. */
    virtual void queryPoint(core::f32 x, core::f32 y, core::f32 radius,
                            const Visitor &visitor) const = 0;

    /** @brief Visits the candidates near the box spanned by two corners. */
    virtual void queryRect(core::f32 x1, core::f32 y1, core::f32 x2, core::f32 y2,
                           const Visitor &visitor) const = 0;

    /** @brief Distinct bodies inserted since the last clear(). */
    [[nodiscard]] virtual core::usize entityCount() const noexcept = 0;

    /** @brief Non-empty buckets (diagnostic). */
    [[nodiscard]] virtual core::usize cellCount() const noexcept = 0;

    [[nodiscard]] std::vector<CircleBody *> query(const CircleBody &body) const
    {
        std::vector<CircleBody *> out;
        query(body, [&out](CircleBody &other) { out.push_back(&other); });
        return out;
    }

    [[nodiscard]] std::vector<CircleBody *> queryPoint(core::f32 x, core::f32 y,
                                                       core::f32 radius = 0.0f) const
    {
        std::vector<CircleBody *> out;
        queryPoint(x, y, radius, [&out](CircleBody &other) { out.push_back(&other); });
        return out;
    }

    [[nodiscard]] std::vector<CircleBody *> queryRect(core::f32 x1, core::f32 y1,
                                                      core::f32 x2, core::f32 y2) const
    {
        std::vector<CircleBody *> out;
        queryRect(x1, y1, x2, y2, [&out](CircleBody &other) { out.push_back(&other); });
        return out;
    }
};

} // namespace astro::physics

#endif // ASTRO_PHYSICS_ISPATIALINDEX_HPP

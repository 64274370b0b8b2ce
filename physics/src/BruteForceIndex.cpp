/**
 * @file BruteForceIndex.cpp
 * @brief Linear-scan spatial index implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <astro/physics/BruteForceIndex.hpp>

#include <algorithm>

namespace astro::physics {

void BruteForceIndex::clear()
{
    _bodies.clear();
}

void BruteForceIndex::insert(CircleBody &body)
{
    if (std::find(_bodies.begin(), _bodies.end(), &body) == _bodies.end())
    {
        _bodies.push_back(&body);
    }
}

void BruteForceIndex::query(const CircleBody &body, const Visitor &visitor) const
{
    const auto p = body.position();
    const auto r = body.radius();
    scan(p.x - r, p.y - r, p.x + r, p.y + r, &body, visitor);
}

void BruteForceIndex::queryPoint(core::f32 x, core::f32 y, core::f32 radius,
                                 const Visitor &visitor) const
{
    const core::f32 r = std::max(radius, 0.0f);
    scan(x - r, y - r, x + r, y + r, nullptr, visitor);
}

void BruteForceIndex::queryRect(core::f32 x1, core::f32 y1, core::f32 x2, core::f32 y2,
                                const Visitor &visitor) const
{
    scan(std::min(x1, x2), std::min(y1, y2), std::max(x1, x2), std::max(y1, y2), nullptr, visitor);
}

void BruteForceIndex::scan(core::f32 minX, core::f32 minY, core::f32 maxX, core::f32 maxY,
                           const CircleBody *exclude, const Visitor &visitor) const
{
    for (CircleBody *body : _bodies)
    {
        if (body == exclude)
        {
            continue;
        }

        const auto p = body->position();
        const auto r = body->radius();
        if (p.x + r < minX || p.x - r > maxX || p.y + r < minY || p.y - r > maxY)
        {
            continue;
        }

        visitor(*body);
    }
}

} // namespace astro::physics

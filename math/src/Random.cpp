/**
 * @file Random.cpp
 * @brief Random implementation on top of std::mt19937_64.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include <astro/math/Random.hpp>

#include <algorithm>
#include <utility>

namespace astro::math {

Random::Random(core::u64 seed)
    : _engine{seed}
{}

core::f32 Random::uniform(core::f32 lo, core::f32 hi)
{
    if (hi < lo)
        std::swap(lo, hi);
    if (lo == hi)
        return lo;
    std::uniform_real_distribution<core::f32> dist{lo, hi};
    return std::clamp(dist(_engine), lo, hi);
}

core::i32 Random::uniformInt(core::i32 lo, core::i32 hi)
{
    if (hi < lo)
        std::swap(lo, hi);
    std::uniform_int_distribution<core::i32> dist{lo, hi};
    return dist(_engine);
}

void Random::reseed(core::u64 seed)
{
    _engine.seed(seed);
}

} // namespace astro::math

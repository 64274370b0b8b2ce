/**
 * @file PoolHandle.hpp
 * @brief Pool slot identifier: packed generation + slot index.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ASTRO_MEMORY_POOLHANDLE_HPP
    #define ASTRO_MEMORY_POOLHANDLE_HPP

#include <astro/core/Types.hpp>

#include <functional>
#include <limits>

namespace astro::memory {

/**
 * @class PoolHandle
 * @brief Packed 64-bit reference to one pool slot.
 *
 * Layout (MSB → LSB):
 *   [generation : 32] [slot : 32]
 *
 * The generation advances every time the slot is released, so a handle
 * kept past its release no longer matches and is rejected.  The null
 * handle marks an instance that is not pool-managed (overflow).
 */
class PoolHandle final
{
public:
    static constexpr core::u64 kSlotMask = 0xFFFF'FFFFull;

    /** @brief Null sentinel. */
    static constexpr core::u64 kNull = std::numeric_limits<core::u64>::max();

    /** @brief Default-constructs a null handle. */
    constexpr PoolHandle() noexcept = default;

    /**
     * @brief Constructs from separate generation + slot.
     * @param generation Generation counter.
     * @param slot       Slot index.
     */
    constexpr PoolHandle(core::u32 generation, core::u32 slot) noexcept
        : _raw{(static_cast<core::u64>(generation) << 32) | static_cast<core::u64>(slot)}
    {}

    /** @brief Returns the slot index. */
    [[nodiscard]] constexpr core::u32 slot() const noexcept
    {
        return static_cast<core::u32>(_raw & kSlotMask);
    }

    /** @brief Returns the generation counter. */
    [[nodiscard]] constexpr core::u32 generation() const noexcept
    {
        return static_cast<core::u32>(_raw >> 32);
    }

    /** @brief Returns the raw packed value. */
    [[nodiscard]] constexpr core::u64 raw() const noexcept { return _raw; }

    /** @brief Tests whether the handle refers to a pool slot. */
    [[nodiscard]] constexpr bool isValid() const noexcept
    {
        return _raw != kNull;
    }

    [[nodiscard]] constexpr bool operator==(PoolHandle other) const noexcept
    {
        return _raw == other._raw;
    }

private:
    core::u64 _raw{kNull};
};

} // namespace astro::memory

template <>
struct std::hash<astro::memory::PoolHandle>
{
    [[nodiscard]] std::size_t operator()(astro::memory::PoolHandle h) const noexcept
    {
        return std::hash<astro::core::u64>{}(h.raw());
    }
};

#endif // ASTRO_MEMORY_POOLHANDLE_HPP

/**
 * @file ObjectPool.hpp
 * @brief Recycling allocator for one entity kind with bounded lazy growth.
 *
 * Instances are built once by a factory and then cycle between the
 * available stack and the active set for the lifetime of the pool.  The
 * pool never resets instance state: whatever acquires an instance owns
 * the job of fully reinitialising it.
 *
 * Growth stops at maxSize.  Acquiring from an empty pool at capacity
 * still succeeds and hands out an overflow instance that the pool does
 * not track; the lease owns it and dropping it destroys it.
 *
 * @tparam T Pooled type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_MEMORY_OBJECT_POOL_HPP
    #define ASTRO_MEMORY_OBJECT_POOL_HPP

    #include "PoolHandle.hpp"

    #include <astro/core/Expected.hpp>
    #include <astro/core/NonCopyable.hpp>

    #include <functional>
    #include <memory>
    #include <span>
    #include <unordered_map>
    #include <utility>
    #include <vector>

namespace astro::memory {

template <typename T>
class ObjectPool final : private core::NonCopyable<ObjectPool<T>> {
public:
    /** @brief Builds one fresh instance; returning nullptr is a fatal failure. */
    using Factory = std::function<std::unique_ptr<T>()>;

    /**
     * @brief Result of acquire(): the instance plus how it is owned.
     *
     * A pooled lease carries a valid handle and no ownership.  An
     * overflow lease carries a null handle and owns its instance.
     */
    class Lease final {
    public:
        [[nodiscard]] T *get()        const noexcept { return _object; }
        [[nodiscard]] T *operator->() const noexcept { return _object; }
        [[nodiscard]] T &operator*()  const noexcept { return *_object; }

        [[nodiscard]] PoolHandle handle()   const noexcept { return _handle; }
        [[nodiscard]] bool       isPooled() const noexcept { return _handle.isValid(); }

        /** @brief Hands the overflow instance to the caller (empty for pooled leases). */
        [[nodiscard]] std::unique_ptr<T> takeOwnership() noexcept { return std::move(_owned); }

    private:
        friend class ObjectPool;

        Lease(T *object, PoolHandle handle, std::unique_ptr<T> owned) noexcept
            : _object{object}, _handle{handle}, _owned{std::move(owned)}
        {}

        T                 *_object;
        PoolHandle         _handle;
        std::unique_ptr<T> _owned;
    };

    /**
     * @brief Builds a pool and pre-warms @p initial instances.
     * @param factory Instance factory (must be callable).
     * @param initial Instances created up front (<= maxSize).
     * @param maxSize Upper bound on pool-managed instances (> 0).
     * @return The pool, or kInvalidArgument for a bad configuration and
     *         kOutOfMemory if the factory fails while pre-warming.
     */
    [[nodiscard]] static core::Expected<ObjectPool> create(Factory factory,
                                                           core::usize initial,
                                                           core::usize maxSize);

    ObjectPool(ObjectPool &&) noexcept            = default;
    ObjectPool &operator=(ObjectPool &&) noexcept = default;
    ~ObjectPool()                                 = default;

    /**
     * @brief Pops the most recently released instance, or builds one.
     *
     * The returned instance carries stale state from its previous use.
     * Fails only when the factory returns nullptr.
     */
    [[nodiscard]] core::Expected<Lease> acquire();

    /** @brief Acquires @p count instances; stops at the first failure. */
    [[nodiscard]] core::Expected<std::vector<Lease>> acquireMany(core::usize count);

    /**
     * @brief Returns an active instance to the available stack.
     * @return false (and no effect) for null, stale or inactive handles.
     */
    bool release(PoolHandle handle);

    /** @brief Releases by address; no-op for instances the pool does not track. */
    bool release(const T *object);

    /** @brief Returns a pooled lease, or destroys an overflow instance. */
    void release(Lease &&lease);

    /** @brief Releases each handle in turn; returns how many were returned. */
    core::usize releaseAll(std::span<const PoolHandle> handles);

    /** @brief Current handle of a pool-managed address (null if unmanaged). Never dereferences. */
    [[nodiscard]] PoolHandle handleOf(const T *object) const;

    [[nodiscard]] bool isActive(PoolHandle handle) const noexcept;

    /** @brief Resolves an active handle; nullptr if stale or inactive. */
    [[nodiscard]] T *get(PoolHandle handle) const noexcept;

    [[nodiscard]] core::usize available()     const noexcept { return _available.size(); }
    [[nodiscard]] core::usize active()        const noexcept { return _activeCount; }
    [[nodiscard]] core::usize total()         const noexcept { return _slots.size(); }
    [[nodiscard]] core::usize maxSize()       const noexcept { return _maxSize; }
    [[nodiscard]] core::usize overflowCount() const noexcept { return _overflowCount; }

private:
    struct Slot
    {
        std::unique_ptr<T> object;
        core::u32          generation{0};
        bool               active{false};
    };

    ObjectPool(Factory factory, core::usize maxSize);

    core::u32 addSlot(std::unique_ptr<T> object, bool active);

    Factory                                 _factory;
    std::vector<Slot>                       _slots;
    std::vector<core::u32>                  _available;
    std::unordered_map<const T *, core::u32> _index;
    core::usize                             _activeCount{0};
    core::usize                             _maxSize{0};
    core::usize                             _overflowCount{0};
};

} // namespace astro::memory

    #include "ObjectPool.inl"

#endif // ASTRO_MEMORY_OBJECT_POOL_HPP

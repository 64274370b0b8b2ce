/**
 * @file Lifecycle.hpp
 * @brief Acquire / reset / release policy for one entity kind.
 *
 * A Lifecycle sits between the simulation and an optional ObjectPool.
 * With a pool, instances are recycled and reinitialised through
 * `T::reset`; without one (or when the pool overflows) instances are
 * constructed fresh and owned by the lifecycle until released.  Either
 * way the caller only ever sees a `T *` whose address is stable until
 * release.
 *
 * @tparam T A Poolable entity kind.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_LIFECYCLE_HPP
    #define ASTRO_ENTITY_LIFECYCLE_HPP

    #include "EntityGroup.hpp"
    #include "Poolable.hpp"

    #include <astro/memory/ObjectPool.hpp>
    #include <astro/core/Expected.hpp>
    #include <astro/core/NonCopyable.hpp>

    #include <memory>
    #include <optional>
    #include <unordered_map>
    #include <vector>

namespace astro::entity {

template <Poolable T>
class Lifecycle final : private core::NonCopyable<Lifecycle<T>> {
public:
    using Params = typename T::Params;
    using Pool   = memory::ObjectPool<T>;

    /**
     * @brief Identity of one live entity: its address plus the pool handle
     *        (pooled) or the ticket (unpooled) it was acquired with.
     *
     * An address alone is ambiguous once the instance is recycled; the
     * handle generation or ticket tells the lives apart.
     */
    struct Acquired
    {
        T                 *entity{nullptr};
        memory::PoolHandle handle{};
        core::u64          ticket{0};

        /** @brief false for unpooled and overflow instances. */
        [[nodiscard]] bool isPooled() const noexcept { return handle.isValid(); }
    };

    /** @param pool Non-owning; must outlive the lifecycle.  nullptr disables pooling. */
    explicit Lifecycle(Pool *pool = nullptr) noexcept;

    ~Lifecycle() = default;

    /** @brief Registers a group every live entity of this kind belongs to. */
    void track(EntityGroup &group);

    /**
     * @brief Produces a live, fully reinitialised entity added to every tracked group.
     * @return The entity, or the pool's error if its factory failed.
     */
    [[nodiscard]] core::Expected<Acquired> acquire(const Params &params);

    /** @brief Reinitialises @p entity and (re)adds it to every tracked group. */
    void reset(T &entity, const Params &params);

    /**
     * @brief Retires an entity: marks it dead, detaches it from every
     *        tracked group, then returns it to the pool or destroys it.
     *
     * Idempotent.  @p ref is checked against the pool generation or the
     * unpooled ticket before anything is dereferenced, so releasing an
     * already-released identity is a no-op even when its address has
     * since been handed to a new entity.
     *
     * @return true if @p ref was live and is now retired.
     */
    bool release(const Acquired &ref);

    /** @brief true while @p ref names the live entity it was acquired as. */
    [[nodiscard]] bool isCurrent(const Acquired &ref) const;

    /**
     * @brief Current identity of a live entity, looked up by address.
     *
     * Resolve while the entity is known to be live (e.g. when collecting
     * it for a deferred release) and keep the result, not the pointer.
     */
    [[nodiscard]] std::optional<Acquired> find(const T *entity) const;

    /** @brief true while @p entity is live and pool-managed. */
    [[nodiscard]] bool isPooled(const T *entity) const;

    /** @brief true while @p entity is live and managed by this lifecycle. */
    [[nodiscard]] bool owns(const T *entity) const;

    [[nodiscard]] core::usize liveCount()     const noexcept;
    [[nodiscard]] core::usize unpooledCount() const noexcept { return _unpooled.size(); }
    [[nodiscard]] Pool       *pool()          const noexcept { return _pool; }

private:
    void attach(T &entity);
    void detach(const T *entity);

    struct Unpooled
    {
        std::unique_ptr<T> object;
        core::u64          ticket{0};
    };

    Pool                                   *_pool;
    std::vector<EntityGroup *>              _groups;
    std::unordered_map<const T *, Unpooled> _unpooled;
    core::u64                               _nextTicket{0};
};

} // namespace astro::entity

    #include "Lifecycle.inl"

#endif // ASTRO_ENTITY_LIFECYCLE_HPP

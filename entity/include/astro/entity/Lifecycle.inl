/**
 * @file Lifecycle.inl
 * @brief Lifecycle template implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_ENTITY_LIFECYCLE_INL
    #define ASTRO_ENTITY_LIFECYCLE_INL

    #include <astro/core/Log.hpp>

    #include <algorithm>
    #include <string>
    #include <utility>

namespace astro::entity {

template <Poolable T>
Lifecycle<T>::Lifecycle(Pool *pool) noexcept
    : _pool{pool}
{}

template <Poolable T>
void Lifecycle<T>::track(EntityGroup &group)
{
    if (std::find(_groups.begin(), _groups.end(), &group) == _groups.end())
        _groups.push_back(&group);
}

template <Poolable T>
core::Expected<typename Lifecycle<T>::Acquired> Lifecycle<T>::acquire(const Params &params)
{
    if (!_pool)
    {
        auto owned = std::make_unique<T>(params);
        T *raw = owned.get();
        const core::u64 ticket = ++_nextTicket;
        _unpooled.emplace(raw, Unpooled{std::move(owned), ticket});
        attach(*raw);
        return Acquired{raw, memory::PoolHandle{}, ticket};
    }

    auto acquired = _pool->acquire();
    if (!acquired)
        return std::unexpected(std::move(acquired.error()));

    auto &lease = *acquired;
    T *raw = lease.get();
    core::u64 ticket = 0;
    if (!lease.isPooled())
    {
        core::Log::debug("LIFECYCLE", std::string{physics::bodyKindName(T::kKind)} +
                                      " pool exhausted, using an unpooled instance");
        ticket = ++_nextTicket;
        _unpooled.emplace(raw, Unpooled{lease.takeOwnership(), ticket});
    }

    reset(*raw, params);
    return Acquired{raw, lease.handle(), ticket};
}

template <Poolable T>
void Lifecycle<T>::reset(T &entity, const Params &params)
{
    entity.reset(params);
    attach(entity);
}

template <Poolable T>
bool Lifecycle<T>::isCurrent(const Acquired &ref) const
{
    if (!ref.entity)
        return false;

    if (!ref.isPooled())
    {
        const auto it = _unpooled.find(ref.entity);
        return it != _unpooled.end() && it->second.ticket == ref.ticket;
    }

    return _pool && _pool->get(ref.handle) == ref.entity;
}

template <Poolable T>
bool Lifecycle<T>::release(const Acquired &ref)
{
    if (!isCurrent(ref))
        return false;

    ref.entity->markDead();
    detach(ref.entity);

    if (!ref.isPooled())
    {
        _unpooled.erase(ref.entity);
        return true;
    }
    return _pool->release(ref.handle);
}

template <Poolable T>
std::optional<typename Lifecycle<T>::Acquired> Lifecycle<T>::find(const T *entity) const
{
    if (!entity)
        return std::nullopt;

    if (const auto it = _unpooled.find(entity); it != _unpooled.end())
        return Acquired{it->second.object.get(), memory::PoolHandle{}, it->second.ticket};

    if (!_pool)
        return std::nullopt;

    const memory::PoolHandle handle = _pool->handleOf(entity);
    T *live = _pool->get(handle);
    if (!live)
        return std::nullopt;
    return Acquired{live, handle, 0};
}

template <Poolable T>
bool Lifecycle<T>::isPooled(const T *entity) const
{
    return _pool && _pool->isActive(_pool->handleOf(entity));
}

template <Poolable T>
bool Lifecycle<T>::owns(const T *entity) const
{
    return _unpooled.contains(entity) || isPooled(entity);
}

template <Poolable T>
core::usize Lifecycle<T>::liveCount() const noexcept
{
    return (_pool ? _pool->active() : 0) + _unpooled.size();
}

template <Poolable T>
void Lifecycle<T>::attach(T &entity)
{
    for (EntityGroup *group : _groups)
        group->add(entity);
}

template <Poolable T>
void Lifecycle<T>::detach(const T *entity)
{
    for (EntityGroup *group : _groups)
        group->remove(entity);
}

} // namespace astro::entity

#endif // ASTRO_ENTITY_LIFECYCLE_INL

/**
 * @file ObjectPool.inl
 * @brief Template implementation of ObjectPool.
 * @see   ObjectPool.hpp
 */

#ifndef ASTRO_MEMORY_OBJECT_POOL_INL
    #define ASTRO_MEMORY_OBJECT_POOL_INL

    #include <astro/core/Assert.hpp>
    #include <astro/core/Log.hpp>

    #include <string>
    #include <utility>

namespace astro::memory {

template <typename T>
ObjectPool<T>::ObjectPool(Factory factory, core::usize maxSize)
    : _factory{std::move(factory)}
    , _maxSize{maxSize}
{
    _slots.reserve(maxSize);
    _available.reserve(maxSize);
}

template <typename T>
core::Expected<ObjectPool<T>> ObjectPool<T>::create(Factory factory,
                                                    core::usize initial,
                                                    core::usize maxSize)
{
    if (!factory)
        return core::makeError(core::ErrorCode::kInvalidArgument, "ObjectPool: factory is empty");
    if (maxSize == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "ObjectPool: max_size must be positive");
    if (initial > maxSize)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "ObjectPool: initial (" + std::to_string(initial)
                               + ") exceeds max_size (" + std::to_string(maxSize) + ")");

    ObjectPool pool{std::move(factory), maxSize};
    for (core::usize i = 0; i < initial; ++i)
    {
        auto object = pool._factory();
        if (!object)
            return core::makeError(core::ErrorCode::kOutOfMemory, "ObjectPool: factory failed while pre-warming");
        pool._available.push_back(pool.addSlot(std::move(object), false));
    }

    core::Log::debug("POOL", "created: initial=" + std::to_string(initial)
                             + " max=" + std::to_string(maxSize));
    return pool;
}

template <typename T>
core::u32 ObjectPool<T>::addSlot(std::unique_ptr<T> object, bool active)
{
    const auto slot = static_cast<core::u32>(_slots.size());
    _index.emplace(object.get(), slot);
    _slots.push_back(Slot{std::move(object), 0, active});
    return slot;
}

template <typename T>
core::Expected<typename ObjectPool<T>::Lease> ObjectPool<T>::acquire()
{
    if (!_available.empty())
    {
        const core::u32 slot = _available.back();
        _available.pop_back();

        Slot &s = _slots[slot];
        ASTRO_ASSERT(!s.active);
        s.active = true;
        ++_activeCount;
        return Lease{s.object.get(), PoolHandle{s.generation, slot}, nullptr};
    }

    auto object = _factory();
    if (!object)
        return core::makeError(core::ErrorCode::kOutOfMemory, "ObjectPool: factory returned null");

    if (_slots.size() < _maxSize)
    {
        T *raw = object.get();
        const core::u32 slot = addSlot(std::move(object), true);
        ++_activeCount;
        return Lease{raw, PoolHandle{0, slot}, nullptr};
    }

    ++_overflowCount;
    core::Log::debug("POOL", "at capacity, handing out unpooled instance");
    T *raw = object.get();
    return Lease{raw, PoolHandle{}, std::move(object)};
}

template <typename T>
core::Expected<std::vector<typename ObjectPool<T>::Lease>> ObjectPool<T>::acquireMany(core::usize count)
{
    std::vector<Lease> leases;
    leases.reserve(count);
    for (core::usize i = 0; i < count; ++i)
    {
        auto lease = acquire();
        if (!lease)
        {
            for (auto &taken : leases)
                release(std::move(taken));
            return std::unexpected(std::move(lease.error()));
        }
        leases.push_back(std::move(*lease));
    }
    return leases;
}

template <typename T>
bool ObjectPool<T>::release(PoolHandle handle)
{
    if (!isActive(handle))
        return false;

    Slot &s = _slots[handle.slot()];
    s.active = false;
    ++s.generation;
    --_activeCount;

    // total() never exceeds maxSize, so a released slot always fits.
    ASTRO_ASSERT(_available.size() < _maxSize);
    _available.push_back(handle.slot());
    return true;
}

template <typename T>
bool ObjectPool<T>::release(const T *object)
{
    return release(handleOf(object));
}

template <typename T>
void ObjectPool<T>::release(Lease &&lease)
{
    if (lease.isPooled())
    {
        release(lease.handle());
        return;
    }
    lease._owned.reset();
    lease._object = nullptr;
}

template <typename T>
core::usize ObjectPool<T>::releaseAll(std::span<const PoolHandle> handles)
{
    core::usize released = 0;
    for (const PoolHandle handle : handles)
    {
        if (release(handle))
            ++released;
    }
    return released;
}

template <typename T>
PoolHandle ObjectPool<T>::handleOf(const T *object) const
{
    const auto it = _index.find(object);
    if (it == _index.end())
        return PoolHandle{};
    return PoolHandle{_slots[it->second].generation, it->second};
}

template <typename T>
bool ObjectPool<T>::isActive(PoolHandle handle) const noexcept
{
    if (!handle.isValid() || handle.slot() >= _slots.size())
        return false;
    const Slot &s = _slots[handle.slot()];
    return s.active && s.generation == handle.generation();
}

template <typename T>
T *ObjectPool<T>::get(PoolHandle handle) const noexcept
{
    return isActive(handle) ? _slots[handle.slot()].object.get() : nullptr;
}

} // namespace astro::memory

#endif // ASTRO_MEMORY_OBJECT_POOL_INL

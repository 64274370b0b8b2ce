/**
 * @file TestObjectPool.cpp
 * @brief Unit tests for memory::ObjectPool and PoolHandle.
 */

#include <catch2/catch_test_macros.hpp>

#include <astro/memory/ObjectPool.hpp>

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace astro::memory {

namespace {

struct Widget
{
    int value{0};
};

ObjectPool<Widget>::Factory widgetFactory(int *built = nullptr)
{
    return [built]() {
        if (built)
            ++*built;
        return std::make_unique<Widget>();
    };
}

template <typename T>
void requireConservation(const ObjectPool<T> &pool)
{
    REQUIRE(pool.total() == pool.available() + pool.active());
    REQUIRE(pool.total() <= pool.maxSize());
}

} // namespace

TEST_CASE("PoolHandle packs generation and slot", "[memory][pool]")
{
    const PoolHandle handle{7, 42};
    REQUIRE(handle.generation() == 7);
    REQUIRE(handle.slot() == 42);
    REQUIRE(handle.isValid());
    REQUIRE_FALSE(PoolHandle{}.isValid());
    REQUIRE(handle == PoolHandle{7, 42});
    REQUIRE_FALSE(handle == PoolHandle{8, 42});
}

TEST_CASE("ObjectPool rejects invalid configuration", "[memory][pool]")
{
    SECTION("empty factory")
    {
        auto pool = ObjectPool<Widget>::create({}, 0, 4);
        REQUIRE_FALSE(pool.has_value());
        REQUIRE(pool.error().code() == core::ErrorCode::kInvalidArgument);
    }
    SECTION("zero max size")
    {
        auto pool = ObjectPool<Widget>::create(widgetFactory(), 0, 0);
        REQUIRE_FALSE(pool.has_value());
        REQUIRE(pool.error().code() == core::ErrorCode::kInvalidArgument);
    }
    SECTION("initial above max size")
    {
        auto pool = ObjectPool<Widget>::create(widgetFactory(), 5, 4);
        REQUIRE_FALSE(pool.has_value());
        REQUIRE(pool.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("ObjectPool pre-warms initial instances", "[memory][pool]")
{
    int built = 0;
    auto pool = ObjectPool<Widget>::create(widgetFactory(&built), 3, 10);
    REQUIRE(pool.has_value());

    REQUIRE(built == 3);
    REQUIRE(pool->available() == 3);
    REQUIRE(pool->active() == 0);
    REQUIRE(pool->total() == 3);
    REQUIRE(pool->maxSize() == 10);
}

TEST_CASE("ObjectPool recycles the most recently released instance", "[memory][pool]")
{
    int built = 0;
    auto pool = ObjectPool<Widget>::create(widgetFactory(&built), 0, 8);
    REQUIRE(pool.has_value());

    auto first = pool->acquire();
    REQUIRE(first.has_value());
    REQUIRE(first->isPooled());
    Widget *address = first->get();
    address->value = 99;

    REQUIRE(pool->release(first->handle()));
    auto again = pool->acquire();
    REQUIRE(again.has_value());

    REQUIRE(again->get() == address);
    // The pool does not reset state; that is the caller's job.
    REQUIRE(again->get()->value == 99);
    REQUIRE(built == 1);
    requireConservation(*pool);
}

TEST_CASE("ObjectPool double release is a no-op", "[memory][pool]")
{
    auto pool = ObjectPool<Widget>::create(widgetFactory(), 2, 4);
    REQUIRE(pool.has_value());

    auto lease = pool->acquire();
    REQUIRE(lease.has_value());
    const PoolHandle handle = lease->handle();

    REQUIRE(pool->release(handle));
    const auto available = pool->available();
    const auto active    = pool->active();

    REQUIRE_FALSE(pool->release(handle));
    REQUIRE_FALSE(pool->release(lease->get()));
    REQUIRE(pool->available() == available);
    REQUIRE(pool->active() == active);
    requireConservation(*pool);
}

TEST_CASE("ObjectPool stale handles cannot release a reused slot", "[memory][pool]")
{
    auto pool = ObjectPool<Widget>::create(widgetFactory(), 1, 1);
    REQUIRE(pool.has_value());

    auto first = pool->acquire();
    REQUIRE(first.has_value());
    const PoolHandle stale = first->handle();
    REQUIRE(pool->release(stale));

    auto second = pool->acquire();
    REQUIRE(second.has_value());
    REQUIRE(second->get() == first->get());
    REQUIRE_FALSE(second->handle() == stale);

    REQUIRE_FALSE(pool->release(stale));
    REQUIRE(pool->active() == 1);
    REQUIRE(pool->get(stale) == nullptr);
    REQUIRE(pool->get(second->handle()) == second->get());
}

TEST_CASE("ObjectPool initial=2 max=2 scenario", "[memory][pool]")
{
    auto pool = ObjectPool<Widget>::create(widgetFactory(), 2, 2);
    REQUIRE(pool.has_value());

    auto a = pool->acquire();
    auto b = pool->acquire();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(pool->active() == 2);
    REQUIRE(pool->available() == 0);

    Widget *released = b->get();
    REQUIRE(pool->release(b->handle()));
    REQUIRE(pool->active() == 1);
    REQUIRE(pool->available() == 1);

    auto c = pool->acquire();
    REQUIRE(c.has_value());
    REQUIRE(c->get() == released);
    REQUIRE(pool->active() == 2);
    REQUIRE(pool->available() == 0);

    auto overflow = pool->acquire();
    REQUIRE(overflow.has_value());
    REQUIRE_FALSE(overflow->isPooled());
    REQUIRE(overflow->get() != nullptr);
    REQUIRE(pool->active() == 2);
    REQUIRE(pool->total() == 2);
    REQUIRE(pool->overflowCount() == 1);

    // Releasing an overflow instance through the pool destroys it without
    // touching the pool's bookkeeping.
    REQUIRE_FALSE(pool->release(overflow->get()));
    pool->release(std::move(*overflow));
    REQUIRE(pool->active() == 2);
    REQUIRE(pool->available() == 0);
    requireConservation(*pool);
}

TEST_CASE("ObjectPool total never decreases", "[memory][pool]")
{
    auto pool = ObjectPool<Widget>::create(widgetFactory(), 0, 16);
    REQUIRE(pool.has_value());

    auto leases = pool->acquireMany(10);
    REQUIRE(leases.has_value());
    REQUIRE(pool->total() == 10);

    std::vector<PoolHandle> handles;
    for (const auto &lease : *leases)
        handles.push_back(lease.handle());

    REQUIRE(pool->releaseAll(handles) == 10);
    REQUIRE(pool->releaseAll(handles) == 0);
    REQUIRE(pool->total() == 10);
    REQUIRE(pool->available() == 10);
    REQUIRE(pool->active() == 0);
    requireConservation(*pool);
}

TEST_CASE("ObjectPool handleOf never reports unmanaged addresses", "[memory][pool]")
{
    auto pool = ObjectPool<Widget>::create(widgetFactory(), 1, 1);
    REQUIRE(pool.has_value());

    Widget outsider;
    REQUIRE_FALSE(pool->handleOf(&outsider).isValid());
    REQUIRE_FALSE(pool->handleOf(nullptr).isValid());
    REQUIRE_FALSE(pool->release(&outsider));

    auto lease = pool->acquire();
    REQUIRE(lease.has_value());
    REQUIRE(pool->handleOf(lease->get()) == lease->handle());
    REQUIRE(pool->isActive(lease->handle()));
}

TEST_CASE("ObjectPool surfaces factory failures", "[memory][pool]")
{
    SECTION("null while pre-warming")
    {
        auto pool = ObjectPool<Widget>::create([] { return std::unique_ptr<Widget>{}; }, 1, 2);
        REQUIRE_FALSE(pool.has_value());
        REQUIRE(pool.error().code() == core::ErrorCode::kOutOfMemory);
    }
    SECTION("null on growth")
    {
        bool fail = false;
        auto pool = ObjectPool<Widget>::create([&fail]() {
            return fail ? std::unique_ptr<Widget>{} : std::make_unique<Widget>();
        }, 1, 4);
        REQUIRE(pool.has_value());

        auto first = pool->acquire();
        REQUIRE(first.has_value());

        fail = true;
        auto second = pool->acquire();
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().code() == core::ErrorCode::kOutOfMemory);
        requireConservation(*pool);
    }
    SECTION("exceptions propagate unchanged")
    {
        auto pool = ObjectPool<Widget>::create([]() -> std::unique_ptr<Widget> {
            throw std::runtime_error{"factory"};
        }, 0, 4);
        REQUIRE(pool.has_value());
        REQUIRE_THROWS_AS(pool->acquire(), std::runtime_error);
    }
}

TEST_CASE("ObjectPool acquireMany rolls back on failure", "[memory][pool]")
{
    int remaining = 3;
    auto pool = ObjectPool<Widget>::create([&remaining]() {
        return remaining-- > 0 ? std::make_unique<Widget>() : std::unique_ptr<Widget>{};
    }, 0, 8);
    REQUIRE(pool.has_value());

    auto leases = pool->acquireMany(5);
    REQUIRE_FALSE(leases.has_value());
    REQUIRE(pool->active() == 0);
    REQUIRE(pool->available() == 3);
    requireConservation(*pool);
}

} // namespace astro::memory

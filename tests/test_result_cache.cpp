#include "tile_develop/pipeline/device_memory.hpp"
#include "tile_develop/pipeline/result_cache.hpp"

#include <memory>

#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using namespace tile_develop::pipeline;

namespace {

std::shared_ptr<const RgbPlanes> buffer(int rows, int cols, float value) {
    auto p = std::make_shared<RgbPlanes>();
    p->R = Matrix2Df::Constant(rows, cols, value);
    p->G = Matrix2Df::Constant(rows, cols, value);
    p->B = Matrix2Df::Constant(rows, cols, value);
    return p;
}

CacheKey key(const std::string& image, const std::string& pass_key, const std::string& tile) {
    return CacheKey{image, 0, pass_key, tile};
}

// 4x4 RGB float = 192 bytes
constexpr size_t kEntry = 4 * 4 * 3 * sizeof(float);
const Rect kRegion{0, 0, 4, 4};

} // namespace

TEST_CASE("cache_hits_only_on_exact_key") {
    ResultCache cache(10 * kEntry);
    REQUIRE(cache.put(key("img", "k1", "t0"), buffer(4, 4, 0.5f), kRegion));

    auto hit = cache.get(key("img", "k1", "t0"), kRegion);
    REQUIRE(hit);
    REQUIRE(hit->R(1, 1) == 0.5f);
    REQUIRE_FALSE(cache.get(key("img", "k1", "t1"), kRegion));
    REQUIRE_FALSE(cache.get(key("img", "k2", "t0"), kRegion));
    REQUIRE_FALSE(cache.get(key("other", "k1", "t0"), kRegion));

    const CacheStats s = cache.stats();
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 3);
    REQUIRE(s.entries == 1);
    REQUIRE(s.bytes == kEntry);
}

TEST_CASE("cache_evicts_least_recently_used") {
    ResultCache cache(2 * kEntry);
    cache.put(key("img", "a", "t"), buffer(4, 4, 1.0f), kRegion);
    cache.put(key("img", "b", "t"), buffer(4, 4, 2.0f), kRegion);
    REQUIRE(cache.get(key("img", "a", "t"), kRegion));

    cache.put(key("img", "c", "t"), buffer(4, 4, 3.0f), kRegion);
    REQUIRE(cache.contains(key("img", "a", "t")));
    REQUIRE_FALSE(cache.contains(key("img", "b", "t")));
    REQUIRE(cache.contains(key("img", "c", "t")));
    REQUIRE(cache.stats().evictions == 1);
}

TEST_CASE("cache_hits_when_stored_region_contains_needed_region") {
    ResultCache cache(10 * kEntry);
    const Rect stored{10, 20, 4, 4};
    REQUIRE(cache.put(key("img", "k", "t"), buffer(4, 4, 1.0f), stored));

    auto inner = cache.get(key("img", "k", "t"), Rect{11, 21, 2, 3});
    REQUIRE(inner);
    REQUIRE(inner->region == stored);
    REQUIRE(inner->buffer->rows() == 4);

    // Needs a column left of what was stored: miss, entry kept.
    REQUIRE_FALSE(cache.get(key("img", "k", "t"), Rect{9, 20, 4, 4}));
    REQUIRE(cache.contains(key("img", "k", "t")));
    REQUIRE(cache.stats().hits == 1);
    REQUIRE(cache.stats().misses == 1);
    REQUIRE(cache.stats().corrupt == 0);
}

TEST_CASE("cache_rejects_buffer_that_does_not_match_its_region") {
    ResultCache cache(10 * kEntry);
    REQUIRE_FALSE(cache.put(key("img", "k", "t"), buffer(4, 4, 1.0f), Rect{0, 0, 4, 5}));
    REQUIRE_FALSE(cache.contains(key("img", "k", "t")));
    REQUIRE(cache.stats().entries == 0);
}

TEST_CASE("cache_does_not_store_entries_larger_than_budget") {
    ResultCache cache(kEntry);
    REQUIRE_FALSE(cache.put(key("img", "k", "t"), buffer(8, 8, 1.0f), Rect{0, 0, 8, 8}));
    REQUIRE(cache.stats().entries == 0);
}

TEST_CASE("cache_flush_drops_one_image") {
    ResultCache cache(10 * kEntry);
    cache.put(key("a", "k", "t0"), buffer(4, 4, 1.0f), kRegion);
    cache.put(key("a", "k", "t1"), buffer(4, 4, 1.0f), kRegion);
    cache.put(key("b", "k", "t0"), buffer(4, 4, 1.0f), kRegion);

    REQUIRE(cache.flush("a") == 2);
    REQUIRE(cache.stats().entries == 1);
    REQUIRE(cache.contains(key("b", "k", "t0")));

    cache.clear();
    REQUIRE(cache.stats().bytes == 0);
}

TEST_CASE("cache_entries_reserve_device_memory") {
    DeviceMemory device(3 * kEntry);
    ResultCache cache(10 * kEntry, &device);
    cache.put(key("img", "a", "t"), buffer(4, 4, 1.0f), kRegion);
    cache.put(key("img", "b", "t"), buffer(4, 4, 1.0f), kRegion);
    REQUIRE(device.used() == 2 * kEntry);

    // A working buffer holds the rest of the device.
    auto working = device.try_reserve(kEntry);
    REQUIRE(working);
    REQUIRE_FALSE(device.try_reserve(1));

    // Storing another entry evicts the oldest to make device room.
    REQUIRE(cache.put(key("img", "c", "t"), buffer(4, 4, 1.0f), kRegion));
    REQUIRE_FALSE(cache.contains(key("img", "a", "t")));

    REQUIRE(cache.reclaim(kEntry) == kEntry);
    REQUIRE(device.used() == 2 * kEntry);
    working->release();
    REQUIRE(device.used() == kEntry);
}

TEST_CASE("device_reservations_release_on_destruction") {
    DeviceMemory device(1000);
    {
        auto a = device.try_reserve(600);
        REQUIRE(a);
        REQUIRE(device.available() == 400);
        REQUIRE_FALSE(device.try_reserve(500));
        DeviceMemory::Reservation moved = std::move(*a);
        REQUIRE(moved.bytes() == 600);
        REQUIRE(device.used() == 600);
    }
    REQUIRE(device.used() == 0);
}

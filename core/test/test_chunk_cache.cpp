#include "test.hpp"

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "lv/core/util/ChunkCache.hpp"

namespace {

lv::ChunkCache::BufferPtr buffer(std::size_t n, uint8_t fill = 0xAB)
{
    return std::make_shared<const lv::ChunkCache::Buffer>(n, fill);
}

}  // namespace

TEST(ChunkCache, MissOnEmpty)
{
    lv::ChunkCache cache;
    EXPECT_TRUE(cache.fetch("/data/a.bin.zst") == nullptr);
    EXPECT_EQ(cache.stats().misses, 1u);
}

TEST(ChunkCache, FetchAfterStoreReturnsSameBytes)
{
    lv::ChunkCache cache;
    auto b = buffer(64, 7);
    EXPECT_TRUE(cache.store("k", b));
    auto got = cache.fetch("k");
    ASSERT_TRUE(got != nullptr);
    EXPECT_EQ(*got, *b);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.storedBytes(), 64u);
    EXPECT_EQ(cache.stats().hits, 1u);
}

TEST(ChunkCache, StoreAboveCeilingIsNoOp)
{
    lv::ChunkCache cache(100);
    EXPECT_FALSE(cache.store("big", buffer(101)));
    EXPECT_TRUE(cache.fetch("big") == nullptr);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().rejected, 1u);

    // exactly at the ceiling is accepted
    EXPECT_TRUE(cache.store("edge", buffer(100)));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ChunkCache, DefaultCeilingIs128MiB)
{
    lv::ChunkCache cache;
    EXPECT_EQ(cache.maxEntryBytes(), std::size_t{128} * 1024 * 1024);
    EXPECT_EQ(cache.maxTotalBytes(), 0u);
}

TEST(ChunkCache, ReplaceKeepsByteAccounting)
{
    lv::ChunkCache cache;
    cache.store("k", buffer(10, 1));
    cache.store("k", buffer(30, 2));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.storedBytes(), 30u);
    EXPECT_EQ((*cache.fetch("k"))[0], 2);
}

TEST(ChunkCache, UnboundedByDefault)
{
    lv::ChunkCache cache;
    for (int i = 0; i < 50; ++i) {
        cache.store("k" + std::to_string(i), buffer(1000));
    }
    EXPECT_EQ(cache.size(), 50u);
    EXPECT_EQ(cache.stats().evictions, 0u);
}

TEST(ChunkCache, TotalCapacityEvictsLeastRecentlyUsed)
{
    lv::ChunkCache cache(100, 250);
    cache.store("a", buffer(100));
    cache.store("b", buffer(100));
    // touch a so b becomes the oldest
    EXPECT_TRUE(cache.fetch("a") != nullptr);
    cache.store("c", buffer(100));

    EXPECT_TRUE(cache.fetch("a") != nullptr);
    EXPECT_TRUE(cache.fetch("b") == nullptr);
    EXPECT_TRUE(cache.fetch("c") != nullptr);
    EXPECT_LE(cache.storedBytes(), 250u);
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(ChunkCache, ClearAndResetStats)
{
    lv::ChunkCache cache;
    cache.store("a", buffer(8));
    cache.fetch("a");
    cache.fetch("nope");
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.storedBytes(), 0u);

    cache.resetStats();
    auto s = cache.stats();
    EXPECT_EQ(s.hits, 0u);
    EXPECT_EQ(s.misses, 0u);
    EXPECT_EQ(s.stores, 0u);
}

TEST(ChunkCache, ConcurrentStoresOfOneKey)
{
    lv::ChunkCache cache;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 100; ++i) {
                cache.store("shared", buffer(16, static_cast<uint8_t>(t)));
                cache.fetch("shared");
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.storedBytes(), 16u);
    EXPECT_EQ(cache.stats().stores, 800u);
}

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "cachet/cache.h"

using namespace cachet;

struct Point3D {
    Point3D(uint32_t a, uint32_t b, uint32_t c) : x(a), y(b), z(c)
    {
    }

    uint32_t x;
    uint32_t y;
    uint32_t z;
};

using PointCache = Cache<uint32_t, Point3D>;

template<EvictionPolicy P> using PolicyTag = std::integral_constant<EvictionPolicy, P>;

template<typename PolicyT> class CacheConcurrencyTest : public testing::Test
{
public:
    std::shared_ptr<PointCache> new_cache(size_t max_size)
    {
        auto config = CacheConfig::builder().max_size(max_size).eviction_policy(PolicyT::value).build();
        EXPECT_TRUE(config.ok()) << config.status();
        return std::make_shared<PointCache>(*std::move(config));
    }
};

using TestTypes = testing::Types<PolicyTag<EvictionPolicy::LRU>, PolicyTag<EvictionPolicy::LFU>, PolicyTag<EvictionPolicy::FIFO>, PolicyTag<EvictionPolicy::Random>>;

TYPED_TEST_SUITE(CacheConcurrencyTest, TestTypes);

TYPED_TEST(CacheConcurrencyTest, MultiThread)
{
    const uint32_t item_count        = 10000;
    const size_t   nb_worker_threads = 5;
    const size_t   ops_per_thread    = 20000;
    const size_t   max_size          = 3000;

    std::vector<std::thread> workers;
    std::atomic<uint32_t>    errors    = 0;
    std::atomic<uint64_t>    get_count = 0;
    auto                     cache     = TestFixture::new_cache(max_size);

    for (size_t i = 0; i < nb_worker_threads; ++i) {
        workers.emplace_back([&, i]() {
            std::default_random_engine              rng(static_cast<unsigned>(i));
            std::uniform_int_distribution<uint32_t> distribution{0, item_count - 1};

            for (size_t op = 0; op < ops_per_thread; ++op) {
                const uint32_t id = distribution(rng);

                const auto fetched_point = cache->get(id);
                ++get_count;

                // gtest assertions are collected on the main thread.
                if (fetched_point) {
                    if (fetched_point->x != id) {
                        ++errors;
                    }
                } else if (!cache->insert(id, Point3D{id, id, id}).ok()) {
                    ++errors;
                }

                if (cache->len() > max_size) {
                    ++errors;
                }
            }
        });
    }

    for (auto& thread : workers) {
        thread.join();
    }

    EXPECT_EQ(0u, errors.load());

    const StatsSnapshot stats = cache->stats();
    EXPECT_EQ(stats.hits + stats.misses, get_count.load());
    EXPECT_EQ(stats.insertions, stats.misses);
    EXPECT_LE(stats.size, max_size);
    EXPECT_LE(stats.size, stats.insertions);
}

TEST(CacheConcurrency, GetOrInsertWithUnderContention)
{
    auto config = CacheConfig::lru(10).build();
    ASSERT_TRUE(config.ok());

    Cache<std::string, int32_t> cache{*std::move(config)};
    ASSERT_TRUE(cache.insert("other", 0).ok());

    const size_t len_before = cache.len();

    std::atomic<int32_t> calls{0};
    auto                 compute = [&calls]() {
        const int32_t call = ++calls;

        // Give the other caller a chance to miss as well.
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
        while (calls.load() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::yield();
        }
        return call * 100;
    };

    std::atomic<bool>       go{false};
    absl::StatusOr<int32_t> results[2];

    std::vector<std::thread> callers;
    for (size_t i = 0; i < 2; ++i) {
        callers.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            results[i] = cache.get_or_insert_with("k", compute);
        });
    }

    go = true;
    for (auto& thread : callers) {
        thread.join();
    }

    ASSERT_TRUE(results[0].ok());
    ASSERT_TRUE(results[1].ok());

    const auto stored = cache.get("k");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*results[0], *stored);
    EXPECT_EQ(*results[1], *stored);

    EXPECT_GE(calls.load(), 1);
    EXPECT_LE(calls.load(), 2);
    EXPECT_EQ(cache.len(), len_before + 1);
    EXPECT_EQ(cache.stats().insertions, 2u);
}

TEST(CacheConcurrency, ComputeRunsOutsideTheLock)
{
    auto config = CacheConfig::lru(10).build();
    ASSERT_TRUE(config.ok());

    Cache<std::string, int32_t> cache{*std::move(config)};

    // A compute that uses the cache from another thread would deadlock if the lock was held.
    auto result = cache.get_or_insert_with("k", [&cache]() {
        std::thread reader([&cache]() { cache.get("unrelated"); });
        reader.join();
        return 7;
    });

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(cache.stats().misses, 2u);
}

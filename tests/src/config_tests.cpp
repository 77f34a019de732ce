#include <gtest/gtest.h>

#include <chrono>
#include <sstream>

#include "cachet/config.h"
#include "cachet/error.h"

using namespace cachet;
using namespace std::chrono_literals;

TEST(CacheConfig, DefaultsAreUnbounded)
{
    auto config = CacheConfig::builder().build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_FALSE(config->max_size().has_value());
    EXPECT_FALSE(config->ttl().has_value());
    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::None);
    EXPECT_TRUE(config->track_metrics());
    EXPECT_EQ(config->statistics_window_size(), CacheConfig::DEFAULT_STATISTICS_WINDOW_SIZE);
    EXPECT_TRUE(config->is_unbounded());
}

TEST(CacheConfig, MaxSizeDefaultsToLRU)
{
    auto config = CacheConfig::builder().max_size(10).build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->max_size(), 10u);
    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::LRU);
    EXPECT_FALSE(config->is_unbounded());
}

TEST(CacheConfig, ExplicitPolicyIsKept)
{
    for (auto policy : {EvictionPolicy::LRU, EvictionPolicy::LFU, EvictionPolicy::FIFO, EvictionPolicy::Random, EvictionPolicy::None}) {
        auto config = CacheConfig::builder().max_size(4).eviction_policy(policy).build();
        ASSERT_TRUE(config.ok()) << config.status();
        EXPECT_EQ(config->eviction_policy(), policy);
    }
}

TEST(CacheConfig, LruPreset)
{
    auto config = CacheConfig::lru(100).build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->max_size(), 100u);
    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::LRU);
    EXPECT_FALSE(config->ttl().has_value());
}

TEST(CacheConfig, TtlPreset)
{
    auto config = CacheConfig::ttl(5s).build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->ttl(), Duration{5s});
    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::None);
    EXPECT_TRUE(config->is_unbounded());
}

TEST(CacheConfig, TtlLruPreset)
{
    auto config = CacheConfig::ttl_lru(30s, 50).build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->ttl(), Duration{30s});
    EXPECT_EQ(config->max_size(), 50u);
    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::LRU);
}

TEST(CacheConfig, PresetsCanBeRefined)
{
    auto config = CacheConfig::lru(8).eviction_policy(EvictionPolicy::LFU).track_metrics(false).build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::LFU);
    EXPECT_FALSE(config->track_metrics());
}

TEST(CacheConfig, MaxSizeCanBeCleared)
{
    auto config = CacheConfig::builder().max_size(10).max_size(std::nullopt).build();
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_TRUE(config->is_unbounded());
    EXPECT_EQ(config->eviction_policy(), EvictionPolicy::None);
}

TEST(CacheConfig, RejectsZeroMaxSize)
{
    auto config = CacheConfig::builder().max_size(0).build();
    EXPECT_TRUE(is_invalid_config(config.status()));

    auto none_config = CacheConfig::builder().max_size(0).eviction_policy(EvictionPolicy::None).build();
    EXPECT_TRUE(is_invalid_config(none_config.status()));
}

TEST(CacheConfig, RejectsPolicyWithoutMaxSize)
{
    for (auto policy : {EvictionPolicy::LRU, EvictionPolicy::LFU, EvictionPolicy::FIFO, EvictionPolicy::Random}) {
        auto config = CacheConfig::builder().eviction_policy(policy).build();
        EXPECT_TRUE(is_invalid_config(config.status())) << policy;
    }
}

TEST(CacheConfig, RejectsNonPositiveTtl)
{
    EXPECT_TRUE(is_invalid_config(CacheConfig::builder().ttl(0s).build().status()));
    EXPECT_TRUE(is_invalid_config(CacheConfig::builder().ttl(-1s).build().status()));
}

TEST(CacheConfig, RejectsEmptyStatisticsWindow)
{
    EXPECT_TRUE(is_invalid_config(CacheConfig::builder().statistics_window_size(0).build().status()));
}

TEST(CacheConfig, UnboundedTtlLessCacheIsAccepted)
{
    auto config = CacheConfig::builder().eviction_policy(EvictionPolicy::None).build();
    EXPECT_TRUE(config.ok());
}

TEST(EvictionPolicy, Printing)
{
    std::ostringstream out;
    out << EvictionPolicy::LRU << " " << EvictionPolicy::Random;
    EXPECT_EQ(out.str(), "LRU Random");
    EXPECT_EQ(to_string(EvictionPolicy::None), "None");
}

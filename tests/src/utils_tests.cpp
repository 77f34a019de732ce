#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "cachet/cache.h"
#include "cachet/log.h"
#include "cachet/utils.h"

using namespace cachet;

using StringCache = Cache<std::string, int32_t>;

namespace {

StringCache new_cache(size_t max_size)
{
    auto config = CacheConfig::lru(max_size).build();
    EXPECT_TRUE(config.ok()) << config.status();
    return StringCache{*std::move(config)};
}

// Routes the library logger to a string for the lifetime of the capture.
class LogCapture
{
public:
    LogCapture() : m_sink{std::make_shared<spdlog::sinks::ostream_sink_mt>(m_output)}
    {
        auto logger = std::make_shared<spdlog::logger>("cachet_test", m_sink);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("%l %v");
        log::set_logger(logger);
    }

    ~LogCapture()
    {
        log::set_logger(nullptr);
    }

    std::string str() const
    {
        return m_output.str();
    }

private:
    std::ostringstream                              m_output;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
};

}  // namespace

TEST(CacheHealthReport, Healthy)
{
    auto cache = new_cache(100);

    for (int32_t i = 0; i < 50; ++i) {
        ASSERT_TRUE(cache.insert("key" + std::to_string(i), i).ok());
    }
    for (int32_t i = 0; i < 50; ++i) {
        cache.get("key" + std::to_string(i));
    }

    const auto report = CacheHealthReport::from(cache);
    EXPECT_EQ(report.health, CacheHealth::Healthy);
    EXPECT_TRUE(report.recommendations.empty());
    EXPECT_EQ(report.stats.hits, 50u);
}

TEST(CacheHealthReport, LowHitRate)
{
    auto cache = new_cache(100);

    for (int32_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(cache.insert("key" + std::to_string(i), i).ok());
    }
    for (int32_t i = 0; i < 10; ++i) {
        cache.get("key" + std::to_string(i));
    }
    for (int32_t i = 100; i < 200; ++i) {
        cache.get("key" + std::to_string(i));
    }

    const auto report = CacheHealthReport::from(cache);
    EXPECT_EQ(report.health, CacheHealth::LowHitRate);
    ASSERT_FALSE(report.recommendations.empty());
    EXPECT_NE(report.recommendations.front().find("Hit rate is"), std::string::npos);
}

TEST(CacheHealthReport, LowHitRateNeedsEnoughAccesses)
{
    auto cache = new_cache(100);

    for (int32_t i = 0; i < 50; ++i) {
        cache.get("key" + std::to_string(i));
    }

    EXPECT_EQ(CacheHealthReport::from(cache).health, CacheHealth::Healthy);
}

TEST(CacheHealthReport, NearCapacity)
{
    auto cache = new_cache(10);

    for (int32_t i = 0; i < 9; ++i) {
        ASSERT_TRUE(cache.insert("key" + std::to_string(i), i).ok());
    }
    for (int32_t i = 0; i < 9; ++i) {
        cache.get("key" + std::to_string(i));
    }

    const auto report = CacheHealthReport::from(cache);
    EXPECT_EQ(report.health, CacheHealth::NearCapacity);
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_NE(report.recommendations.front().find("90.0% full"), std::string::npos);
}

TEST(CacheHealthReport, Critical)
{
    StatsSnapshot stats;
    stats.hits     = 10;
    stats.misses   = 200;
    stats.size     = 95;
    stats.max_size = 100;

    EXPECT_EQ(CacheHealthReport::from_stats(stats).health, CacheHealth::Critical);
}

TEST(CacheHealthReport, EvictionAndExpirationRates)
{
    StatsSnapshot stats;
    stats.hits        = 90;
    stats.misses      = 10;
    stats.evictions   = 50;
    stats.expirations = 40;

    const auto report = CacheHealthReport::from_stats(stats);
    EXPECT_EQ(report.health, CacheHealth::Healthy);
    ASSERT_EQ(report.recommendations.size(), 2u);
    EXPECT_NE(report.recommendations[0].find("High eviction rate: 50.00%"), std::string::npos);
    EXPECT_NE(report.recommendations[1].find("High expiration rate: 40.00%"), std::string::npos);
}

TEST(CacheHealthReport, Printing)
{
    auto cache = new_cache(10);
    ASSERT_TRUE(cache.insert("a", 1).ok());
    cache.get("a");

    std::ostringstream out;
    out << CacheHealthReport::from(cache);

    const std::string text = out.str();
    EXPECT_NE(text.find("Cache Health Report"), std::string::npos);
    EXPECT_NE(text.find("Status: Healthy"), std::string::npos);
    EXPECT_NE(text.find("Size: 1/10"), std::string::npos);
    EXPECT_NE(text.find("Hit Rate: 100.00%"), std::string::npos);
    EXPECT_NE(text.find("Fill: 10.0%"), std::string::npos);
    EXPECT_EQ(text.find("Recommendations"), std::string::npos);
}

TEST(CacheHealthReport, Logging)
{
    StatsSnapshot stats;
    stats.hits     = 1;
    stats.misses   = 200;
    stats.size     = 1;
    stats.max_size = 100;

    LogCapture capture;
    CacheHealthReport::from_stats(stats).log();

    const std::string output = capture.str();
    EXPECT_NE(output.find("warning cache health check: Low Hit Rate"), std::string::npos);
    EXPECT_NE(output.find("cache optimization recommendation"), std::string::npos);
}

TEST(CacheHealth, Printing)
{
    EXPECT_EQ(to_string(CacheHealth::Healthy), "Healthy");
    EXPECT_EQ(to_string(CacheHealth::LowHitRate), "Low Hit Rate");
    EXPECT_EQ(to_string(CacheHealth::NearCapacity), "Near Capacity");
    EXPECT_EQ(to_string(CacheHealth::Critical), "Critical");
}

TEST(MetricsReporter, Report)
{
    auto cache = new_cache(100);
    ASSERT_TRUE(cache.insert("a", 1).ok());
    cache.get("a");
    cache.get("b");

    LogCapture      capture;
    MetricsReporter reporter{"users"};
    reporter.report(cache);

    EXPECT_EQ(reporter.cache_name(), "users");

    const std::string output = capture.str();
    EXPECT_NE(output.find("info cache metrics report: cache=users"), std::string::npos);
    EXPECT_NE(output.find("hits=1 misses=1 hit_rate=50.00%"), std::string::npos);
    EXPECT_NE(output.find("max_size=100"), std::string::npos);
}

TEST(MetricsReporter, ReportJson)
{
    auto cache = new_cache(4);
    ASSERT_TRUE(cache.insert("a", 1).ok());
    cache.get("a");
    cache.get("a");
    cache.get("a");
    cache.get("b");

    MetricsReporter      reporter{"sessions"};
    const nlohmann::json report = reporter.report_json(cache);

    EXPECT_EQ(report.at("cache_name"), "sessions");
    EXPECT_EQ(report.at("size"), 1u);
    EXPECT_EQ(report.at("max_size"), 4u);
    EXPECT_EQ(report.at("hits"), 3u);
    EXPECT_EQ(report.at("misses"), 1u);
    EXPECT_EQ(report.at("total_accesses"), 4u);
    EXPECT_EQ(report.at("evictions"), 0u);
    EXPECT_EQ(report.at("expirations"), 0u);
    EXPECT_DOUBLE_EQ(report.at("hit_rate").get<double>(), 0.75);
    EXPECT_DOUBLE_EQ(report.at("miss_rate").get<double>(), 0.25);
    EXPECT_DOUBLE_EQ(report.at("fill_percentage").get<double>(), 0.25);
}

TEST(MetricsReporter, ReportJsonUnbounded)
{
    auto config = CacheConfig::builder().build();
    ASSERT_TRUE(config.ok()) << config.status();
    StringCache cache{*std::move(config)};
    ASSERT_TRUE(cache.insert("a", 1).ok());

    const nlohmann::json report = MetricsReporter{"unbounded"}.report_json(cache);

    EXPECT_EQ(report.at("size"), 1u);
    EXPECT_TRUE(report.at("max_size").is_null());
    EXPECT_TRUE(report.at("fill_percentage").is_null());
    EXPECT_EQ(report.at("total_accesses"), 0u);
}

TEST(CacheWarmer, Warm)
{
    auto cache = new_cache(100);

    const std::vector<std::pair<std::string, int32_t>> data = {{"config", 1}, {"user_prefs", 2}};

    CacheWarmer warmer;
    EXPECT_EQ(warmer.warm(cache, data), 2u);

    EXPECT_EQ(cache.len(), 2u);
    EXPECT_EQ(cache.get("config"), 1);
    EXPECT_EQ(cache.get("user_prefs"), 2);
}

TEST(CacheWarmer, WarmSkipsRefusedEntries)
{
    auto config = CacheConfig::builder().max_size(1).eviction_policy(EvictionPolicy::None).build();
    ASSERT_TRUE(config.ok());
    StringCache cache{*std::move(config)};

    CacheWarmer warmer;
    EXPECT_EQ(warmer.warm(cache, std::vector<std::pair<std::string, int32_t>>{{"a", 1}, {"b", 2}}), 1u);
    EXPECT_EQ(cache.len(), 1u);
}

TEST(CacheWarmer, WarmWithLoader)
{
    auto cache = new_cache(100);

    const std::map<std::string, int32_t> backend = {{"a", 1}, {"c", 3}};
    auto loader = [&backend](const std::string& key) -> std::optional<int32_t> {
        auto it = backend.find(key);
        if (it == backend.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    CacheWarmer warmer;
    EXPECT_EQ(warmer.warm_with_loader(cache, std::vector<std::string>{"a", "b", "c"}, loader), 2u);

    EXPECT_EQ(cache.len(), 2u);
    EXPECT_EQ(cache.get("a"), 1);
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_EQ(cache.get("c"), 3);
}

#include <absl/strings/str_format.h>

#include "log.h"

namespace cachet {

inline std::string_view to_string(CacheHealth health)
{
    switch (health) {
        case CacheHealth::Healthy:
            return "Healthy";
        case CacheHealth::LowHitRate:
            return "Low Hit Rate";
        case CacheHealth::NearCapacity:
            return "Near Capacity";
        case CacheHealth::Critical:
            return "Critical";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, CacheHealth health)
{
    return os << to_string(health);
}

inline CacheHealthReport CacheHealthReport::from_stats(const StatsSnapshot& stats)
{
    CacheHealthReport report;
    report.stats = stats;

    const uint64_t total_accesses = stats.total_accesses();

    const bool low_hit_rate = stats.hit_rate() < LOW_HIT_RATE_THRESHOLD && total_accesses > MIN_ACCESSES_FOR_HIT_RATE;
    if (low_hit_rate) {
        report.recommendations.push_back(
            absl::StrFormat("Hit rate is %.2f%%. Consider increasing cache size or adjusting TTL.", stats.hit_rate() * 100.0));
    }

    const std::optional<double> fill          = stats.fill_percentage();
    const bool                  near_capacity = fill.has_value() && *fill > NEAR_CAPACITY_THRESHOLD;
    if (near_capacity) {
        report.recommendations.push_back(absl::StrFormat("Cache is %.1f%% full. Consider increasing max_size.", *fill * 100.0));
    }

    if (total_accesses > 0) {
        const double eviction_rate = static_cast<double>(stats.evictions) / static_cast<double>(total_accesses);
        if (eviction_rate > HIGH_EVICTION_RATE_THRESHOLD) {
            report.recommendations.push_back(absl::StrFormat("High eviction rate: %.2f%%. Cache may be too small for workload.", eviction_rate * 100.0));
        }

        const double expiration_rate = static_cast<double>(stats.expirations) / static_cast<double>(total_accesses);
        if (expiration_rate > HIGH_EXPIRATION_RATE_THRESHOLD) {
            report.recommendations.push_back(absl::StrFormat("High expiration rate: %.2f%%. Consider increasing TTL.", expiration_rate * 100.0));
        }
    }

    if (low_hit_rate && near_capacity) {
        report.health = CacheHealth::Critical;
    } else if (low_hit_rate) {
        report.health = CacheHealth::LowHitRate;
    } else if (near_capacity) {
        report.health = CacheHealth::NearCapacity;
    } else {
        report.health = CacheHealth::Healthy;
    }

    return report;
}

template<typename CacheT> CacheHealthReport CacheHealthReport::from(const CacheT& cache)
{
    return from_stats(cache.stats());
}

inline void CacheHealthReport::log() const
{
    auto logger = cachet::log::logger();

    if (health == CacheHealth::Healthy) {
        logger->info("cache health check: {} (hit rate {:.4f}, size {})", to_string(health), stats.hit_rate(), stats.size);
        return;
    }

    logger->warn("cache health check: {} (hit rate {:.4f}, size {}, max size {})",
                 to_string(health),
                 stats.hit_rate(),
                 stats.size,
                 stats.max_size.has_value() ? std::to_string(*stats.max_size) : std::string{"unbounded"});
    for (const auto& recommendation : recommendations) {
        logger->warn("cache optimization recommendation: {}", recommendation);
    }
}

inline std::ostream& operator<<(std::ostream& os, const CacheHealthReport& report)
{
    const StatsSnapshot& stats = report.stats;

    os << "Cache Health Report\n";
    os << "===================\n";
    os << "Status: " << report.health << "\n\n";
    os << "Statistics:\n";
    os << "  Size: " << stats.size << "/";
    if (stats.max_size.has_value()) {
        os << *stats.max_size;
    } else {
        os << "unbounded";
    }
    os << "\n";
    os << "  Hits: " << stats.hits << "\n";
    os << "  Misses: " << stats.misses << "\n";
    os << absl::StrFormat("  Hit Rate: %.2f%%\n", stats.hit_rate() * 100.0);
    os << "  Evictions: " << stats.evictions << "\n";
    os << "  Expirations: " << stats.expirations << "\n";

    const std::optional<double> fill = stats.fill_percentage();
    if (fill.has_value()) {
        os << absl::StrFormat("  Fill: %.1f%%\n", *fill * 100.0);
    }

    if (!report.recommendations.empty()) {
        os << "\nRecommendations:\n";
        for (size_t i = 0; i < report.recommendations.size(); ++i) {
            os << "  " << i + 1 << ". " << report.recommendations[i] << "\n";
        }
    }

    return os;
}

inline MetricsReporter::MetricsReporter(std::string cache_name) : m_cache_name(std::move(cache_name))
{
}

template<typename CacheT> void MetricsReporter::report(const CacheT& cache) const
{
    report_stats(cache.stats());
}

inline void MetricsReporter::report_stats(const StatsSnapshot& stats) const
{
    log::logger()->info("cache metrics report: cache={} size={} max_size={} hits={} misses={} hit_rate={:.2f}% evictions={} expirations={}",
                        m_cache_name,
                        stats.size,
                        stats.max_size.has_value() ? std::to_string(*stats.max_size) : std::string{"unbounded"},
                        stats.hits,
                        stats.misses,
                        stats.hit_rate() * 100.0,
                        stats.evictions,
                        stats.expirations);
}

template<typename CacheT> nlohmann::json MetricsReporter::report_json(const CacheT& cache) const
{
    return report_stats_json(cache.stats());
}

inline nlohmann::json MetricsReporter::report_stats_json(const StatsSnapshot& stats) const
{
    nlohmann::json max_size        = nullptr;
    nlohmann::json fill_percentage = nullptr;
    if (stats.max_size.has_value()) {
        max_size        = *stats.max_size;
        fill_percentage = *stats.fill_percentage();
    }

    return nlohmann::json{{"cache_name", m_cache_name},
                          {"size", stats.size},
                          {"max_size", max_size},
                          {"hits", stats.hits},
                          {"misses", stats.misses},
                          {"hit_rate", stats.hit_rate()},
                          {"miss_rate", stats.miss_rate()},
                          {"evictions", stats.evictions},
                          {"expirations", stats.expirations},
                          {"total_accesses", stats.total_accesses()},
                          {"fill_percentage", fill_percentage}};
}

inline const std::string& MetricsReporter::cache_name() const
{
    return m_cache_name;
}

template<typename CacheT, typename Key, typename Value> size_t CacheWarmer::warm(const CacheT& cache, std::vector<std::pair<Key, Value>> items) const
{
    const size_t requested = items.size();
    log::logger()->info("warming cache with {} entries", requested);

    size_t stored = 0;
    for (auto& [key, value] : items) {
        const absl::Status status = cache.insert(std::move(key), std::move(value));
        if (status.ok()) {
            ++stored;
        } else {
            log::logger()->debug("skipped a warm entry: {}", std::string(status.message()));
        }
    }

    log::logger()->info("cache warming completed: {}/{} stored, final size {}", stored, requested, cache.len());
    return stored;
}

template<typename CacheT, typename Key, typename Loader>
size_t CacheWarmer::warm_with_loader(const CacheT& cache, std::vector<Key> keys, Loader&& loader) const
{
    const size_t requested = keys.size();
    log::logger()->info("warming cache with loader for {} keys", requested);

    size_t stored = 0;
    for (auto& key : keys) {
        auto value = loader(static_cast<const Key&>(key));
        if (!value.has_value()) {
            continue;
        }

        const absl::Status status = cache.insert(std::move(key), std::move(*value));
        if (status.ok()) {
            ++stored;
        } else {
            log::logger()->debug("skipped a loaded entry: {}", std::string(status.message()));
        }
    }

    log::logger()->info("cache warming with loader completed: {}/{} stored, final size {}", stored, requested, cache.len());
    return stored;
}

}  // namespace cachet

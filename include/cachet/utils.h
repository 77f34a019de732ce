#ifndef CACHET_UTILS_H
#define CACHET_UTILS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "stats.h"

namespace cachet {

/// @brief Overall diagnosis of a cache.
enum class CacheHealth {
    Healthy,       //!< Nothing to report.
    LowHitRate,    //!< Fewer than half of the lookups hit.
    NearCapacity,  //!< The cache is more than 85% full.
    Critical       //!< Both of the above.
};

std::string_view to_string(CacheHealth health);
std::ostream&    operator<<(std::ostream& os, CacheHealth health);

/// @brief Health diagnosis of a cache, with tuning recommendations.
/// @details Thresholds:
///           - Low hit rate: under 50% once more than 100 lookups were made.
///           - Near capacity: over 85% full. Unbounded caches are never near capacity.
///           - High eviction rate: evictions above 20% of the lookups.
///           - High expiration rate: expirations above 30% of the lookups.
struct CacheHealthReport {
    static constexpr double   LOW_HIT_RATE_THRESHOLD         = 0.5;
    static constexpr uint64_t MIN_ACCESSES_FOR_HIT_RATE      = 100;
    static constexpr double   NEAR_CAPACITY_THRESHOLD        = 0.85;
    static constexpr double   HIGH_EVICTION_RATE_THRESHOLD   = 0.2;
    static constexpr double   HIGH_EXPIRATION_RATE_THRESHOLD = 0.3;

    CacheHealth              health = CacheHealth::Healthy;
    StatsSnapshot            stats;
    std::vector<std::string> recommendations;

    /// @brief Diagnose a statistics snapshot.
    static CacheHealthReport from_stats(const StatsSnapshot& stats);

    /// @brief Diagnose a cache.
    /// @param cache Any cache exposing `stats()`.
    template<typename CacheT> static CacheHealthReport from(const CacheT& cache);

    /// @brief Log the report through the library logger.
    /// @details A healthy cache logs one info line. Otherwise, a warning is logged along with one
    ///          warning per recommendation.
    void log() const;
};

std::ostream& operator<<(std::ostream& os, const CacheHealthReport& report);

/// @brief Logs the counters of a named cache.
class MetricsReporter
{
public:
    explicit MetricsReporter(std::string cache_name);

    /// @brief Log one info line with every counter of the cache.
    template<typename CacheT> void report(const CacheT& cache) const;

    /// @brief Log one info line with every counter of a snapshot.
    void report_stats(const StatsSnapshot& stats) const;

    /// @brief Get the counters and derived rates of the cache as a JSON object.
    /// @details `max_size` and `fill_percentage` are `null` for an unbounded cache.
    template<typename CacheT> [[nodiscard]] nlohmann::json report_json(const CacheT& cache) const;

    /// @brief Get the counters and derived rates of a snapshot as a JSON object.
    [[nodiscard]] nlohmann::json report_stats_json(const StatsSnapshot& stats) const;

    [[nodiscard]] const std::string& cache_name() const;

private:
    std::string m_cache_name;
};

/// @brief Preloads caches with known data.
class CacheWarmer
{
public:
    /// @brief Insert a batch of items.
    /// @details Inserts refused by the cache are skipped.
    /// @return The number of items stored.
    template<typename CacheT, typename Key, typename Value> size_t warm(const CacheT& cache, std::vector<std::pair<Key, Value>> items) const;

    /// @brief Insert the items a loader produces for a list of keys.
    /// @param loader A callable returning a `std::optional<Value>` for a key. Keys for which it returns
    ///               `std::nullopt` are skipped.
    /// @return The number of items stored.
    template<typename CacheT, typename Key, typename Loader> size_t warm_with_loader(const CacheT& cache, std::vector<Key> keys, Loader&& loader) const;
};

}  // namespace cachet

#include "utils.hpp"

#endif

#ifndef CACHET_STATS_H
#define CACHET_STATS_H

#include <cstdint>
#include <optional>
#include <ostream>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/rolling_count.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>

namespace cachet {

/// @brief Point-in-time view of the cache statistics.
/// @details `evictions` counts every implicit removal, including TTL expiries; `expirations`
///          is the subset of `evictions` caused by TTL.
struct StatsSnapshot {
    uint64_t hits        = 0;  //!< Lookups that found a live entry.
    uint64_t misses      = 0;  //!< Lookups that found nothing or an expired entry.
    uint64_t evictions   = 0;  //!< Entries removed for capacity or expiry.
    uint64_t insertions  = 0;  //!< Successful inserts, replacements included.
    uint64_t expirations = 0;  //!< Entries removed because their TTL elapsed.

    size_t                size = 0;  //!< Number of entries at the time of the snapshot.
    std::optional<size_t> max_size;  //!< Configured capacity, empty when unbounded.

    /// @brief Fraction of lookups that were hits, `0.0` when there were no lookups.
    [[nodiscard]] double hit_rate() const;

    /// @brief `1.0 - hit_rate()`.
    [[nodiscard]] double miss_rate() const;

    /// @brief `hits + misses`, saturated.
    [[nodiscard]] uint64_t total_accesses() const;

    /// @brief `size / max_size`, empty when the cache is unbounded.
    [[nodiscard]] std::optional<double> fill_percentage() const;
};

std::ostream& operator<<(std::ostream& os, const StatsSnapshot& stats);

/// @brief Accumulates cache events.
/// @details Not synchronized: it lives inside the cache critical section. When disabled, every
///          `record_*` call is a no-op and all counters stay at zero.
class StatsCollector
{
public:
    StatsCollector(bool enabled, uint32_t window_size);

    void record_hit();
    void record_miss();
    void record_insertion();
    void record_eviction();
    void record_expiration();

    /// @brief Zero all counters and restart the rolling window.
    void reset();

    /// @brief Capture the counters along with the size information supplied by the storage.
    [[nodiscard]] StatsSnapshot snapshot(size_t size, std::optional<size_t> max_size) const;

    /// @brief Hit rate over the last `window_size()` lookups.
    [[nodiscard]] double rolling_hit_rate() const;

    [[nodiscard]] uint32_t window_size() const;
    [[nodiscard]] bool     enabled() const;

private:
    using RollingStatistics = boost::accumulators::stats<boost::accumulators::tag::rolling_mean, boost::accumulators::tag::rolling_count>;
    using MeanAccumulator   = boost::accumulators::accumulator_set<double, RollingStatistics>;

    bool     m_enabled;
    uint32_t m_window_size;

    uint64_t m_hits        = 0;
    uint64_t m_misses      = 0;
    uint64_t m_evictions   = 0;
    uint64_t m_insertions  = 0;
    uint64_t m_expirations = 0;

    MeanAccumulator m_hit_rate_acc;

    static void saturating_increment(uint64_t& counter);
};

}  // namespace cachet

#include "stats.hpp"

#endif

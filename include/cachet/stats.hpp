#include <iomanip>
#include <limits>

namespace cachet {

inline double StatsSnapshot::hit_rate() const
{
    const uint64_t total = total_accesses();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(hits) / static_cast<double>(total);
}

inline double StatsSnapshot::miss_rate() const
{
    return 1.0 - hit_rate();
}

inline uint64_t StatsSnapshot::total_accesses() const
{
    if (hits > std::numeric_limits<uint64_t>::max() - misses) {
        return std::numeric_limits<uint64_t>::max();
    }
    return hits + misses;
}

inline std::optional<double> StatsSnapshot::fill_percentage() const
{
    if (!max_size.has_value()) {
        return std::nullopt;
    }
    if (*max_size == 0) {
        return 0.0;
    }
    return static_cast<double>(size) / static_cast<double>(*max_size);
}

inline std::ostream& operator<<(std::ostream& os, const StatsSnapshot& stats)
{
    const auto flags     = os.flags();
    const auto precision = os.precision();

    os << "hits=" << stats.hits << " misses=" << stats.misses << " hit_rate=" << std::fixed << std::setprecision(4) << stats.hit_rate();
    os.flags(flags);
    os.precision(precision);

    os << " evictions=" << stats.evictions << " expirations=" << stats.expirations << " insertions=" << stats.insertions << " size=" << stats.size;

    if (stats.max_size.has_value()) {
        os << "/" << *stats.max_size;
    } else {
        os << "/unbounded";
    }
    return os;
}

inline StatsCollector::StatsCollector(bool enabled, uint32_t window_size)
 : m_enabled{enabled},
   m_window_size{window_size},
   m_hit_rate_acc(boost::accumulators::tag::rolling_window::window_size = window_size)
{
}

inline void StatsCollector::record_hit()
{
    if (m_enabled) {
        saturating_increment(m_hits);
        m_hit_rate_acc(1.0);
    }
}

inline void StatsCollector::record_miss()
{
    if (m_enabled) {
        saturating_increment(m_misses);
        m_hit_rate_acc(0.0);
    }
}

inline void StatsCollector::record_insertion()
{
    if (m_enabled) {
        saturating_increment(m_insertions);
    }
}

inline void StatsCollector::record_eviction()
{
    if (m_enabled) {
        saturating_increment(m_evictions);
    }
}

inline void StatsCollector::record_expiration()
{
    if (m_enabled) {
        saturating_increment(m_expirations);
    }
}

inline void StatsCollector::reset()
{
    m_hits        = 0;
    m_misses      = 0;
    m_evictions   = 0;
    m_insertions  = 0;
    m_expirations = 0;

    m_hit_rate_acc = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_window_size);
}

inline StatsSnapshot StatsCollector::snapshot(size_t size, std::optional<size_t> max_size) const
{
    StatsSnapshot snapshot;
    snapshot.hits        = m_hits;
    snapshot.misses      = m_misses;
    snapshot.evictions   = m_evictions;
    snapshot.insertions  = m_insertions;
    snapshot.expirations = m_expirations;
    snapshot.size        = size;
    snapshot.max_size    = max_size;
    return snapshot;
}

inline double StatsCollector::rolling_hit_rate() const
{
    // The rolling mean of an empty window is 0/0.
    if (boost::accumulators::rolling_count(m_hit_rate_acc) == 0) {
        return 0.0;
    }
    return boost::accumulators::rolling_mean(m_hit_rate_acc);
}

inline uint32_t StatsCollector::window_size() const
{
    return m_window_size;
}

inline bool StatsCollector::enabled() const
{
    return m_enabled;
}

inline void StatsCollector::saturating_increment(uint64_t& counter)
{
    if (counter != std::numeric_limits<uint64_t>::max()) {
        ++counter;
    }
}

}  // namespace cachet

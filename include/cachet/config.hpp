#include "error.h"
#include "log.h"

namespace cachet {

inline std::string_view to_string(EvictionPolicy policy)
{
    switch (policy) {
        case EvictionPolicy::LRU:
            return "LRU";
        case EvictionPolicy::LFU:
            return "LFU";
        case EvictionPolicy::FIFO:
            return "FIFO";
        case EvictionPolicy::Random:
            return "Random";
        case EvictionPolicy::None:
            return "None";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, EvictionPolicy policy)
{
    return os << to_string(policy);
}

inline CacheConfigBuilder CacheConfig::builder()
{
    return CacheConfigBuilder{};
}

inline CacheConfigBuilder CacheConfig::lru(size_t max_size)
{
    CacheConfigBuilder builder;
    builder.lru(max_size);
    return builder;
}

inline CacheConfigBuilder CacheConfig::ttl(Duration ttl)
{
    CacheConfigBuilder builder;
    builder.ttl(ttl).eviction_policy(EvictionPolicy::None);
    return builder;
}

inline CacheConfigBuilder CacheConfig::ttl_lru(Duration ttl, size_t max_size)
{
    CacheConfigBuilder builder;
    builder.ttl_lru(ttl, max_size);
    return builder;
}

inline std::optional<size_t> CacheConfig::max_size() const
{
    return m_max_size;
}

inline std::optional<Duration> CacheConfig::ttl() const
{
    return m_ttl;
}

inline EvictionPolicy CacheConfig::eviction_policy() const
{
    return m_eviction_policy;
}

inline bool CacheConfig::track_metrics() const
{
    return m_track_metrics;
}

inline uint32_t CacheConfig::statistics_window_size() const
{
    return m_statistics_window_size;
}

inline bool CacheConfig::is_unbounded() const
{
    return !m_max_size.has_value();
}

inline CacheConfigBuilder& CacheConfigBuilder::max_size(std::optional<size_t> max_size)
{
    m_max_size = max_size;
    return *this;
}

inline CacheConfigBuilder& CacheConfigBuilder::ttl(Duration ttl)
{
    m_ttl = ttl;
    return *this;
}

inline CacheConfigBuilder& CacheConfigBuilder::eviction_policy(EvictionPolicy policy)
{
    m_eviction_policy = policy;
    return *this;
}

inline CacheConfigBuilder& CacheConfigBuilder::track_metrics(bool enabled)
{
    m_track_metrics = enabled;
    return *this;
}

inline CacheConfigBuilder& CacheConfigBuilder::statistics_window_size(uint32_t window_size)
{
    m_statistics_window_size = window_size;
    return *this;
}

inline CacheConfigBuilder& CacheConfigBuilder::lru(size_t max_size)
{
    m_max_size        = max_size;
    m_eviction_policy = EvictionPolicy::LRU;
    return *this;
}

inline CacheConfigBuilder& CacheConfigBuilder::ttl_lru(Duration ttl, size_t max_size)
{
    m_ttl = ttl;
    return lru(max_size);
}

inline absl::StatusOr<CacheConfig> CacheConfigBuilder::build() const
{
    const EvictionPolicy policy = m_eviction_policy.value_or(m_max_size.has_value() ? EvictionPolicy::LRU : EvictionPolicy::None);

    auto reject = [](std::string_view reason) {
        log::logger()->debug("rejected cache configuration: {}", reason);
        return make_invalid_config(reason);
    };

    if (m_max_size.has_value() && *m_max_size == 0) {
        return reject("max_size must be at least 1");
    }

    if (policy != EvictionPolicy::None && !m_max_size.has_value()) {
        return reject("an eviction policy requires a max_size");
    }

    if (m_ttl.has_value() && m_ttl->count() <= 0) {
        return reject("ttl must be strictly positive");
    }

    if (m_statistics_window_size == 0) {
        return reject("statistics_window_size must be at least 1");
    }

    CacheConfig config;
    config.m_max_size               = m_max_size;
    config.m_ttl                    = m_ttl;
    config.m_eviction_policy        = policy;
    config.m_track_metrics          = m_track_metrics;
    config.m_statistics_window_size = m_statistics_window_size;
    return config;
}

}  // namespace cachet

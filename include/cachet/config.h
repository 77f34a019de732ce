#ifndef CACHET_CONFIG_H
#define CACHET_CONFIG_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include <absl/status/statusor.h>

#include "clock.h"

namespace cachet {

/// @brief Discipline used to pick a victim when a new key does not fit.
enum class EvictionPolicy {
    LRU,     //!< Evict the least recently used key.
    LFU,     //!< Evict the least frequently used key, then the least recently used among those.
    FIFO,    //!< Evict the oldest insertion, regardless of reads.
    Random,  //!< Evict a key picked uniformly at random.
    None     //!< Never evict: inserting a new key in a full cache fails.
};

std::string_view to_string(EvictionPolicy policy);
std::ostream&    operator<<(std::ostream& os, EvictionPolicy policy);

class CacheConfigBuilder;

/// @brief Validated cache configuration.
/// @details Instances can only be obtained through `CacheConfigBuilder::build()`, so every
///          `CacheConfig` in circulation satisfies the configuration rules:
///           - A policy other than `None` requires a maximum size.
///           - A maximum size, when set, is at least one.
///           - A TTL, when set, is strictly positive.
///
///          A configuration with neither TTL nor maximum size is accepted and behaves as a plain
///          unbounded map.
class CacheConfig
{
public:
    static constexpr uint32_t DEFAULT_STATISTICS_WINDOW_SIZE = 1000;

    /// @brief Start building a configuration from scratch.
    static CacheConfigBuilder builder();

    /// @brief Preset for a count-bounded LRU cache.
    /// @param max_size The maximum number of entries.
    static CacheConfigBuilder lru(size_t max_size);

    /// @brief Preset for an unbounded cache whose entries expire.
    /// @param ttl How long an entry stays valid after insertion.
    static CacheConfigBuilder ttl(Duration ttl);

    /// @brief Preset combining expiry with a count-bounded LRU.
    static CacheConfigBuilder ttl_lru(Duration ttl, size_t max_size);

    [[nodiscard]] std::optional<size_t>   max_size() const;
    [[nodiscard]] std::optional<Duration> ttl() const;
    [[nodiscard]] EvictionPolicy          eviction_policy() const;
    [[nodiscard]] bool                    track_metrics() const;
    [[nodiscard]] uint32_t                statistics_window_size() const;

    /// @brief Whether the cache grows without bound.
    [[nodiscard]] bool is_unbounded() const;

private:
    friend class CacheConfigBuilder;

    CacheConfig() = default;

    std::optional<size_t>   m_max_size;
    std::optional<Duration> m_ttl;
    EvictionPolicy          m_eviction_policy        = EvictionPolicy::None;
    bool                    m_track_metrics          = true;
    uint32_t                m_statistics_window_size = DEFAULT_STATISTICS_WINDOW_SIZE;
};

/// @brief Fluent builder for `CacheConfig`.
/// @details When no policy is selected explicitly, `build()` picks LRU if a maximum size was set
///          and `None` otherwise. Metrics are tracked unless disabled.
class CacheConfigBuilder
{
public:
    CacheConfigBuilder() = default;

    /// @brief Set (or clear, with `std::nullopt`) the maximum number of entries.
    CacheConfigBuilder& max_size(std::optional<size_t> max_size);

    /// @brief Enable time-based expiration.
    CacheConfigBuilder& ttl(Duration ttl);

    /// @brief Select the eviction discipline.
    CacheConfigBuilder& eviction_policy(EvictionPolicy policy);

    /// @brief Enable or disable the statistics counters.
    CacheConfigBuilder& track_metrics(bool enabled);

    /// @brief Set how many lookups the rolling hit rate covers.
    CacheConfigBuilder& statistics_window_size(uint32_t window_size);

    /// @brief Shortcut for `max_size(max_size).eviction_policy(EvictionPolicy::LRU)`.
    CacheConfigBuilder& lru(size_t max_size);

    /// @brief Shortcut for `ttl(ttl).lru(max_size)`.
    CacheConfigBuilder& ttl_lru(Duration ttl, size_t max_size);

    /// @brief Validate the options and produce a configuration.
    /// @return The configuration, or an `InvalidArgument` status describing the first violated rule.
    [[nodiscard]] absl::StatusOr<CacheConfig> build() const;

private:
    std::optional<size_t>         m_max_size;
    std::optional<Duration>       m_ttl;
    std::optional<EvictionPolicy> m_eviction_policy;
    bool                          m_track_metrics          = true;
    uint32_t                      m_statistics_window_size = CacheConfig::DEFAULT_STATISTICS_WINDOW_SIZE;
};

}  // namespace cachet

#include "config.hpp"

#endif

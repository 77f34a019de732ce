#ifndef CACHET_STORAGE_H
#define CACHET_STORAGE_H

#include <cstdint>
#include <optional>
#include <variant>

#include <absl/container/node_hash_map.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "cachet/clock.h"
#include "cachet/config.h"
#include "cachet/entry.h"
#include "cachet/stats.h"
#include "cachet/policy/eviction_fifo.h"
#include "cachet/policy/eviction_lfu.h"
#include "cachet/policy/eviction_lru.h"
#include "cachet/policy/eviction_none.h"
#include "cachet/policy/eviction_random.h"
#include "traits.h"

namespace cachet::detail {

/// @brief Entry table, eviction bookkeeping and statistics of a cache.
/// @details This class holds the whole cache state but does no locking: callers serialize every
///          call, either behind a mutex (`Cache`) or on a strand (`AsyncCache`).
///
///          The eviction policy is picked once, at construction, from the configuration. Policies
///          are held in a variant, and events are only forwarded to the handlers a policy declares.
///
///          Keys are stored in a node-based map so that their address is stable: policies keep
///          references to the keys instead of copies.
template<typename Key, typename Value, typename KeyHash, typename Clock> class Storage
{
public:
    using CacheEntry = Entry<Value>;

    Storage(CacheConfig config, Clock clock);

    /// @brief Look a key up, counting a hit or a miss.
    /// @details An expired entry is removed on the spot and counts as an eviction.
    std::optional<Value> get(const Key& key);

    /// @brief Insert or replace a value, evicting one entry if the key is new and the cache is full.
    /// @return `CapacityExceeded` when the cache is full and has no eviction policy, OK otherwise.
    absl::Status insert(Key key, Value value);

    /// @brief Store a freshly computed value unless a live entry already exists for the key.
    /// @details No hit or miss is counted: the caller already did the lookup.
    /// @return The value held in cache for `key` once the call completes.
    absl::StatusOr<Value> insert_if_absent(Key key, Value value);

    /// @brief Whether a live entry exists for the key. Does not count as an access.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Remove a key. Manual removals are not evictions.
    /// @return Whether an entry was removed.
    bool invalidate(const Key& key);

    /// @brief Remove a key and hand back its value.
    /// @return The removed value, or `std::nullopt` if the key was absent or expired.
    std::optional<Value> remove(const Key& key);

    /// @brief Remove every entry. Statistics are kept.
    void clear();

    /// @brief Remove every expired entry.
    /// @return The number of entries removed.
    size_t cleanup_expired();

    /// @brief Call `fn(key, value)` for every live entry.
    template<typename F> void for_each(F&& fn) const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] StatsSnapshot stats() const;
    [[nodiscard]] double        rolling_hit_rate() const;
    void                        reset_stats();

    [[nodiscard]] const CacheConfig& config() const;

private:
    using DataMap   = absl::node_hash_map<Key, CacheEntry, KeyHash>;
    using DataMapIt = typename DataMap::iterator;

    using PolicyVariant = std::variant<policy::EvictionLRU<Key, KeyHash, Value>,
                                       policy::EvictionLFU<Key, KeyHash, Value>,
                                       policy::EvictionFIFO<Key, KeyHash, Value>,
                                       policy::EvictionRandom<Key, KeyHash, Value>,
                                       policy::EvictionNone<Key, KeyHash, Value>>;

    CacheConfig    m_config;
    Clock          m_clock;
    DataMap        m_data;
    PolicyVariant  m_policy;
    StatsCollector m_stats;

    static PolicyVariant make_policy(EvictionPolicy kind);

    [[nodiscard]] bool is_expired(const CacheEntry& entry, TimePoint now) const;
    [[nodiscard]] bool is_full() const;

    bool evict_one();
    void expire(DataMapIt it);
    void remove(DataMapIt it);

    template<typename P> DataMapIt find_victim(const P& policy);

    void on_insert(const Key& key, const CacheEntry& entry);
    void on_update(const Key& key, const CacheEntry& entry);
    void on_cache_hit(const Key& key, const CacheEntry& entry);
    void on_evict(const Key& key, const CacheEntry& entry);
};

}  // namespace cachet::detail

#include "storage.hpp"

#endif

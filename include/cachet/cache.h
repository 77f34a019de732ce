#ifndef CACHET_CACHE_H
#define CACHET_CACHE_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include <absl/hash/hash.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "clock.h"
#include "config.h"
#include "stats.h"
#include "detail/storage.h"

/// @brief Root namespace
namespace cachet {

/// @brief Thread-safe in-process key/value cache.
/// @details A `Cache` is a handle: copies are cheap and share the same entries, eviction state and
///          statistics. The last copy to go away releases every entry.
///
///          Every operation is serialized behind a single mutex, so operations on one cache are
///          linearizable. The only work done outside the mutex is the `compute` callback of
///          `get_or_insert_with`.
///
///          Values are returned by copy, `Value` must be copy-constructible.
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the cache.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
/// @tparam Clock The time source used for TTL expiry. Defaults to `SteadyClock`.
template<typename Key, typename Value, typename KeyHash = absl::Hash<Key>, typename Clock = SteadyClock> class Cache
{
public:
    using CacheType = Cache<Key, Value, KeyHash, Clock>;
    using LockGuard = std::unique_lock<std::mutex>;

    /// @brief Create an empty cache.
    /// @param config The validated cache configuration.
    /// @param clock The time source to use for TTL expiry.
    explicit Cache(CacheConfig config, Clock clock = Clock{});

    /// @brief Retrieve an item from the cache.
    /// @details A hit refreshes the item position in the eviction policy. An expired item is removed
    ///          and the lookup counts as a miss.
    /// @param key The key of the item to retrieve.
    /// @return A copy of the item if it was found and live, `std::nullopt` otherwise.
    std::optional<Value> get(const Key& key) const;

    /// @brief Insert or replace an item.
    /// @details Replacing an item resets its timestamps and its access count. Inserting a new key into
    ///          a full cache evicts exactly one item first.
    /// @param key The key of the item.
    /// @param value The item.
    /// @return `CapacityExceeded` if the cache is full and has no eviction policy, in which case nothing
    ///         changed. OK otherwise.
    [[nodiscard]] absl::Status insert(Key key, Value value) const;

    /// @brief Remove an item from the cache.
    /// @return Whether an item was removed.
    bool invalidate(const Key& key) const;

    /// @brief Remove an item from the cache and return it.
    /// @return The removed item, or `std::nullopt` if there was no live item for this key.
    std::optional<Value> remove(const Key& key) const;

    /// @brief Check whether a live item exists for a key.
    /// @details Unlike `get`, this does not count as an access and does not touch the eviction policy.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Remove every item. Statistics are kept.
    void clear() const;

    /// @brief Get the number of items in the cache.
    /// @details Expired items that were not observed yet are still counted.
    [[nodiscard]] size_t len() const;

    [[nodiscard]] bool is_empty() const;

    /// @brief Get the configured maximum number of items, empty when unbounded.
    [[nodiscard]] std::optional<size_t> capacity() const;

    /// @brief Get a consistent snapshot of the statistics.
    [[nodiscard]] StatsSnapshot stats() const;

    /// @brief Get the hit rate over the most recent lookups.
    /// @details The window size is set by `CacheConfigBuilder::statistics_window_size`.
    [[nodiscard]] double rolling_hit_rate() const;

    /// @brief Zero every counter.
    void reset_stats() const;

    /// @brief Remove every expired item.
    /// @return The number of items removed.
    size_t cleanup_expired() const;

    /// @brief Call `fn(key, value)` for every live item.
    /// @details The live items are copied under the lock and `fn` runs after it is released, so `fn`
    ///          may call back into the cache. Changes made meanwhile are not reflected in the visit.
    template<typename F> void for_each(F&& fn) const;

    /// @brief Get the item for a key, computing and inserting it if absent.
    /// @details `compute` runs without holding the cache lock. When several callers miss the same key
    ///          at the same time, each of them may run `compute`; the first value stored wins and every
    ///          caller receives a copy of it.
    ///
    ///          If `compute` throws, the exception propagates and the cache is left unchanged.
    /// @param key The key of the item.
    /// @param compute A callable returning a `Value`.
    /// @return The item associated with `key`, or `CapacityExceeded` if it had to be inserted in a full
    ///         cache without eviction policy.
    template<typename F> absl::StatusOr<Value> get_or_insert_with(const Key& key, F&& compute) const;

    [[nodiscard]] const CacheConfig& config() const;

private:
    using MyStorage = detail::Storage<Key, Value, KeyHash, Clock>;

    struct State {
        State(CacheConfig config, Clock clock);

        mutable std::mutex m_mutex;
        MyStorage          m_storage;
    };

    std::shared_ptr<State> m_state;

    LockGuard lock() const;
};

}  // namespace cachet

#include "cache.hpp"

#endif

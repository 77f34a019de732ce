#ifndef CACHET_EVICTION_LFU
#define CACHET_EVICTION_LFU

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>

#include "cachet/entry.h"
#include "cachet/policy/detail/index_list.h"

namespace cachet::policy {

/// @brief Least Frequently Used (LFU) eviction policy.
/// @details Keys are grouped in buckets by access frequency. A key enters the policy with a
///          frequency of one, and each cache hit moves it to the tail of the next bucket.
///          Victims are taken from the lowest-frequency bucket, head first: among keys with the
///          same frequency, the one touched least recently goes first, and keys that were never
///          read leave in insertion order.
///          Only stores references to keys kept alive by the cache.
/// @tparam Key The type of the keys used to identify items in the cache.
/// @tparam KeyHash The hasher used for keys.
/// @tparam Value The type of the values stored in the cache.
template<typename Key, typename KeyHash, typename Value> class EvictionLFU
{
public:
    using Frequency  = uint64_t;
    using CacheEntry = cachet::Entry<Value>;

    /// @brief The frequency assigned to freshly inserted keys.
    static constexpr Frequency INITIAL_FREQUENCY = 1;

private:
    using KeyRef    = std::reference_wrapper<const Key>;
    using KeyList   = detail::IndexList<KeyRef>;
    using KeyIndex  = typename KeyList::Index;
    using BucketMap = std::map<Frequency, KeyList>;
    using BucketIt  = typename BucketMap::const_iterator;

    struct Slot {
        Frequency m_frequency;
        KeyIndex  m_index;
    };

    using SlotMap = std::unordered_map<KeyRef, Slot, KeyHash, std::equal_to<Key>>;

public:
    /// @brief Iterator for iterating over cache items in the order they should be
    ///        evicted.
    /// @details Walks the buckets by increasing frequency, and each bucket from head to tail.
    class VictimIterator
    {
    public:
        VictimIterator(BucketIt bucket, BucketIt bucket_end);

        const Key&      operator*() const;
        VictimIterator& operator++();
        VictimIterator  operator++(int);
        bool            operator==(const VictimIterator& other) const;
        bool            operator!=(const VictimIterator& other) const;

    private:
        BucketIt m_bucket;
        BucketIt m_bucket_end;
        KeyIndex m_index;
    };

    /// @brief Clears the policy.
    void clear();

    /// @brief Insertion event handler.
    /// @details Appends the key to the bucket of `INITIAL_FREQUENCY`.
    void on_insert(const Key& key, const CacheEntry& entry);

    /// @brief Update event handler.
    /// @details A replaced value forgets its history: the key goes back to the bucket of `INITIAL_FREQUENCY`.
    void on_update(const Key& key, const CacheEntry& entry);

    /// @brief Cache hit event handler.
    /// @details Moves the key to the tail of the next frequency bucket.
    void on_cache_hit(const Key& key, const CacheEntry& entry);

    /// @brief Eviction event handler.
    /// @details Removes the key from its bucket, dropping the bucket if it becomes empty.
    void on_evict(const Key& key, const CacheEntry& entry);

    /// @brief Get the current frequency of a key.
    /// @return The frequency, or zero if the key is not tracked by the policy.
    [[nodiscard]] Frequency frequency(const Key& key) const;

    [[nodiscard]] VictimIterator victim_begin() const;
    [[nodiscard]] VictimIterator victim_end() const;

private:
    BucketMap m_buckets;
    SlotMap   m_slots;

    Slot attach(const Key& key, Frequency frequency);
    void detach(const Slot& slot);
};

}  // namespace cachet::policy

#include "eviction_lfu.hpp"

#endif

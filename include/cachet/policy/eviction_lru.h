#ifndef CACHET_EVICTION_LRU
#define CACHET_EVICTION_LRU

#include <functional>
#include <unordered_map>

#include "cachet/entry.h"
#include "cachet/policy/detail/index_list.h"

namespace cachet::policy {

/// @brief Least Recently Used (LRU) eviction policy.
/// @details Implemented internally using an arena-backed linked list.
///          The keys are ordered from most-recently used to least-recently used.
///          Only stores references to keys kept alive by the cache.
/// @tparam Key The type of the keys used to identify items in the cache.
/// @tparam KeyHash The hasher used for keys.
/// @tparam Value The type of the values stored in the cache.
template<typename Key, typename KeyHash, typename Value> class EvictionLRU
{
private:
    using KeyRef    = std::reference_wrapper<const Key>;
    using KeyList   = detail::IndexList<KeyRef>;
    using KeyIndex  = typename KeyList::Index;
    using KeyRefMap = std::unordered_map<KeyRef, KeyIndex, KeyHash, std::equal_to<Key>>;

public:
    using CacheEntry = cachet::Entry<Value>;

    /// @brief Iterator for iterating over cache items in the order they should be
    ///        evicted.
    class VictimIterator
    {
    public:
        VictimIterator(const KeyList& keys, KeyIndex index);

        const Key&      operator*() const;
        VictimIterator& operator++();
        VictimIterator  operator++(int);
        bool            operator==(const VictimIterator& other) const;
        bool            operator!=(const VictimIterator& other) const;

    private:
        const KeyList* m_keys;
        KeyIndex       m_index;
    };

    /// @brief Clears the policy.
    void clear();

    /// @brief Insertion event handler.
    /// @details Inserts the provided item at the front of the list.
    /// @param key The key of the inserted item.
    /// @param entry The entry that has been inserted in cache.
    void on_insert(const Key& key, const CacheEntry& entry);

    /// @brief Update event handler.
    /// @details Moves the provided item to the front of the list, as if it had just been inserted.
    /// @param key The key that has been updated in the cache.
    /// @param entry The new entry for this key.
    void on_update(const Key& key, const CacheEntry& entry);

    /// @brief Cache hit event handler.
    /// @details Moves the provided item at the front of the list.
    /// @param key The key that has been hit.
    /// @param entry The entry that has been hit.
    void on_cache_hit(const Key& key, const CacheEntry& entry);

    /// @brief Eviction event handler.
    /// @details Unlinks the key wherever it sits in the list.
    /// @param key The key that left the cache.
    /// @param entry The entry that left the cache.
    void on_evict(const Key& key, const CacheEntry& entry);

    /// @brief Get an iterator to the first item that should be evicted.
    /// @details Considering that the keys are ordered internally from most-recently used
    ///          to least-recently used, this iterator will effectively walk the internal
    ///          structure backwards.
    /// @return An item iterator.
    [[nodiscard]] VictimIterator victim_begin() const;

    /// @brief Get an end iterator.
    /// @return The end iterator.
    [[nodiscard]] VictimIterator victim_end() const;

private:
    KeyList   m_keys;
    KeyRefMap m_nodes;
};

}  // namespace cachet::policy

#include "eviction_lru.hpp"

#endif

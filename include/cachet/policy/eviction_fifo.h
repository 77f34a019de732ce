#ifndef CACHET_EVICTION_FIFO
#define CACHET_EVICTION_FIFO

#include <functional>
#include <unordered_map>

#include "cachet/entry.h"
#include "cachet/policy/detail/index_list.h"

namespace cachet::policy {

/// @brief First In First Out (FIFO) eviction policy.
/// @details Keys are queued in insertion order and evicted from the head of the queue. Cache hits
///          do not affect the order, so this policy has no cache hit handler.
template<typename Key, typename KeyHash, typename Value> class EvictionFIFO
{
private:
    using KeyRef    = std::reference_wrapper<const Key>;
    using KeyList   = detail::IndexList<KeyRef>;
    using KeyIndex  = typename KeyList::Index;
    using KeyRefMap = std::unordered_map<KeyRef, KeyIndex, KeyHash, std::equal_to<Key>>;

public:
    using CacheEntry = cachet::Entry<Value>;

    /// @brief Walks the queue from oldest to newest insertion.
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

    void clear();

    void on_insert(const Key& key, const CacheEntry& entry);

    /// @brief Update event handler.
    /// @details A replaced value goes back to the tail of the queue, as if it had just been inserted.
    void on_update(const Key& key, const CacheEntry& entry);

    void on_evict(const Key& key, const CacheEntry& entry);

    [[nodiscard]] VictimIterator victim_begin() const;
    [[nodiscard]] VictimIterator victim_end() const;

private:
    KeyList   m_keys;
    KeyRefMap m_nodes;
};

}  // namespace cachet::policy

#include "eviction_fifo.hpp"

#endif

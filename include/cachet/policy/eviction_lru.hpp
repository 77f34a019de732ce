#include <cassert>

namespace cachet::policy {

template<class K, class KH, class V>
EvictionLRU<K, KH, V>::VictimIterator::VictimIterator(const KeyList& keys, KeyIndex index) : m_keys(&keys),
                                                                                           m_index(index)
{
}

template<class K, class KH, class V> const K& EvictionLRU<K, KH, V>::VictimIterator::operator*() const
{
    return m_keys->at(m_index);
}

template<class K, class KH, class V> auto EvictionLRU<K, KH, V>::VictimIterator::operator++() -> VictimIterator&
{
    m_index = m_keys->prev(m_index);
    return *this;
}

template<class K, class KH, class V> auto EvictionLRU<K, KH, V>::VictimIterator::operator++(int) -> VictimIterator
{
    VictimIterator previous = *this;
    ++(*this);
    return previous;
}

template<class K, class KH, class V> bool EvictionLRU<K, KH, V>::VictimIterator::operator==(const VictimIterator& other) const
{
    return m_index == other.m_index;
}

template<class K, class KH, class V> bool EvictionLRU<K, KH, V>::VictimIterator::operator!=(const VictimIterator& other) const
{
    return m_index != other.m_index;
}

template<class K, class KH, class V> void EvictionLRU<K, KH, V>::clear()
{
    m_keys.clear();
    m_nodes.clear();
}

template<class K, class KH, class V> void EvictionLRU<K, KH, V>::on_insert(const K& key, const CacheEntry& /* entry */)
{
    assert(m_nodes.find(std::ref(key)) == m_nodes.end());  // Validate the item is not already in policy.

    const KeyIndex index = m_keys.push_front(std::ref(key));
    m_nodes.emplace(std::ref(key), index);
}

template<class K, class KH, class V> void EvictionLRU<K, KH, V>::on_update(const K& key, const CacheEntry& entry)
{
    on_cache_hit(key, entry);
}

template<class K, class KH, class V> void EvictionLRU<K, KH, V>::on_cache_hit(const K& key, const CacheEntry& /* entry */)
{
    auto node_it = m_nodes.find(std::ref(key));
    if (node_it != m_nodes.end()) {
        m_keys.move_to_front(node_it->second);
    } else {
        // If this is tripped, there is a disconnect between the contents of the policy and the contents of the cache.
        assert(false);
    }
}

template<class K, class KH, class V> void EvictionLRU<K, KH, V>::on_evict(const K& key, const CacheEntry& /* entry */)
{
    auto node_it = m_nodes.find(std::ref(key));
    assert(node_it != m_nodes.end());

    m_keys.erase(node_it->second);
    m_nodes.erase(node_it);
}

template<class K, class KH, class V> auto EvictionLRU<K, KH, V>::victim_begin() const -> VictimIterator
{
    return VictimIterator{m_keys, m_keys.back()};
}

template<class K, class KH, class V> auto EvictionLRU<K, KH, V>::victim_end() const -> VictimIterator
{
    return VictimIterator{m_keys, KeyList::npos};
}

}  // namespace cachet::policy

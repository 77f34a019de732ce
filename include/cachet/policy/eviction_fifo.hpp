#include <cassert>

namespace cachet::policy {

template<class K, class KH, class V>
EvictionFIFO<K, KH, V>::VictimIterator::VictimIterator(const KeyList& keys, KeyIndex index) : m_keys(&keys),
                                                                                            m_index(index)
{
}

template<class K, class KH, class V> const K& EvictionFIFO<K, KH, V>::VictimIterator::operator*() const
{
    return m_keys->at(m_index);
}

template<class K, class KH, class V> auto EvictionFIFO<K, KH, V>::VictimIterator::operator++() -> VictimIterator&
{
    m_index = m_keys->next(m_index);
    return *this;
}

template<class K, class KH, class V> auto EvictionFIFO<K, KH, V>::VictimIterator::operator++(int) -> VictimIterator
{
    VictimIterator previous = *this;
    ++(*this);
    return previous;
}

template<class K, class KH, class V> bool EvictionFIFO<K, KH, V>::VictimIterator::operator==(const VictimIterator& other) const
{
    return m_index == other.m_index;
}

template<class K, class KH, class V> bool EvictionFIFO<K, KH, V>::VictimIterator::operator!=(const VictimIterator& other) const
{
    return m_index != other.m_index;
}

template<class K, class KH, class V> void EvictionFIFO<K, KH, V>::clear()
{
    m_keys.clear();
    m_nodes.clear();
}

template<class K, class KH, class V> void EvictionFIFO<K, KH, V>::on_insert(const K& key, const CacheEntry& /* entry */)
{
    assert(m_nodes.find(std::ref(key)) == m_nodes.end());

    const KeyIndex index = m_keys.push_back(std::ref(key));
    m_nodes.emplace(std::ref(key), index);
}

template<class K, class KH, class V> void EvictionFIFO<K, KH, V>::on_update(const K& key, const CacheEntry& /* entry */)
{
    auto node_it = m_nodes.find(std::ref(key));
    assert(node_it != m_nodes.end());

    m_keys.move_to_back(node_it->second);
}

template<class K, class KH, class V> void EvictionFIFO<K, KH, V>::on_evict(const K& key, const CacheEntry& /* entry */)
{
    auto node_it = m_nodes.find(std::ref(key));
    assert(node_it != m_nodes.end());

    m_keys.erase(node_it->second);
    m_nodes.erase(node_it);
}

template<class K, class KH, class V> auto EvictionFIFO<K, KH, V>::victim_begin() const -> VictimIterator
{
    return VictimIterator{m_keys, m_keys.front()};
}

template<class K, class KH, class V> auto EvictionFIFO<K, KH, V>::victim_end() const -> VictimIterator
{
    return VictimIterator{m_keys, KeyList::npos};
}

}  // namespace cachet::policy

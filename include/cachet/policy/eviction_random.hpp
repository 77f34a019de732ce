#include <atomic>
#include <cassert>
#include <chrono>

namespace cachet::policy {

template<class K, class KH, class V>
EvictionRandom<K, KH, V>::VictimIterator::VictimIterator(const KeyVector& keys, size_t start, size_t visited)
 : m_keys(&keys),
   m_start(start),
   m_visited(visited)
{
}

template<class K, class KH, class V> const K& EvictionRandom<K, KH, V>::VictimIterator::operator*() const
{
    assert(m_visited < m_keys->size());
    return (*m_keys)[(m_start + m_visited) % m_keys->size()];
}

template<class K, class KH, class V> auto EvictionRandom<K, KH, V>::VictimIterator::operator++() -> VictimIterator&
{
    ++m_visited;
    return *this;
}

template<class K, class KH, class V> auto EvictionRandom<K, KH, V>::VictimIterator::operator++(int) -> VictimIterator
{
    VictimIterator previous = *this;
    ++(*this);
    return previous;
}

template<class K, class KH, class V> bool EvictionRandom<K, KH, V>::VictimIterator::operator==(const VictimIterator& other) const
{
    return m_visited == other.m_visited;
}

template<class K, class KH, class V> bool EvictionRandom<K, KH, V>::VictimIterator::operator!=(const VictimIterator& other) const
{
    return m_visited != other.m_visited;
}

template<class K, class KH, class V> EvictionRandom<K, KH, V>::EvictionRandom() : m_generator(clock_seed())
{
}

template<class K, class KH, class V> void EvictionRandom<K, KH, V>::seed(uint64_t value)
{
    m_generator.seed(value);
}

template<class K, class KH, class V> void EvictionRandom<K, KH, V>::clear()
{
    m_keys.clear();
    m_slots.clear();
}

template<class K, class KH, class V> void EvictionRandom<K, KH, V>::on_insert(const K& key, const CacheEntry& /* entry */)
{
    assert(m_slots.find(std::ref(key)) == m_slots.end());

    m_slots.emplace(std::ref(key), m_keys.size());
    m_keys.push_back(std::ref(key));
}

template<class K, class KH, class V> void EvictionRandom<K, KH, V>::on_evict(const K& key, const CacheEntry& /* entry */)
{
    auto slot_it = m_slots.find(std::ref(key));
    assert(slot_it != m_slots.end());

    const size_t slot = slot_it->second;
    m_slots.erase(slot_it);

    // Swap-remove: the last key takes over the freed slot.
    const size_t last = m_keys.size() - 1;
    if (slot != last) {
        m_keys[slot]          = m_keys[last];
        m_slots[m_keys[slot]] = slot;
    }
    m_keys.pop_back();
}

template<class K, class KH, class V> auto EvictionRandom<K, KH, V>::victim_begin() const -> VictimIterator
{
    if (m_keys.empty()) {
        return victim_end();
    }

    std::uniform_int_distribution<size_t> distribution{0, m_keys.size() - 1};
    return VictimIterator{m_keys, distribution(m_generator), 0};
}

template<class K, class KH, class V> auto EvictionRandom<K, KH, V>::victim_end() const -> VictimIterator
{
    return VictimIterator{m_keys, 0, m_keys.size()};
}

template<class K, class KH, class V> uint64_t EvictionRandom<K, KH, V>::clock_seed()
{
    // Policies created within the same clock tick still get distinct seeds.
    static std::atomic<uint64_t> sequence{0};

    const auto ticks = static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
    return ticks ^ (sequence.fetch_add(1) * 0x9E3779B97F4A7C15ULL);
}

}  // namespace cachet::policy

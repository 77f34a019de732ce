#include <cassert>
#include <limits>

namespace cachet::policy {

template<class K, class KH, class V>
EvictionLFU<K, KH, V>::VictimIterator::VictimIterator(BucketIt bucket, BucketIt bucket_end)
 : m_bucket(bucket),
   m_bucket_end(bucket_end),
   m_index(bucket != bucket_end ? bucket->second.front() : KeyList::npos)
{
}

template<class K, class KH, class V> const K& EvictionLFU<K, KH, V>::VictimIterator::operator*() const
{
    return m_bucket->second.at(m_index);
}

template<class K, class KH, class V> auto EvictionLFU<K, KH, V>::VictimIterator::operator++() -> VictimIterator&
{
    m_index = m_bucket->second.next(m_index);
    if (m_index == KeyList::npos) {
        // Buckets are never empty, so the next bucket always has a head.
        ++m_bucket;
        if (m_bucket != m_bucket_end) {
            m_index = m_bucket->second.front();
        }
    }
    return *this;
}

template<class K, class KH, class V> auto EvictionLFU<K, KH, V>::VictimIterator::operator++(int) -> VictimIterator
{
    VictimIterator previous = *this;
    ++(*this);
    return previous;
}

template<class K, class KH, class V> bool EvictionLFU<K, KH, V>::VictimIterator::operator==(const VictimIterator& other) const
{
    return m_bucket == other.m_bucket && m_index == other.m_index;
}

template<class K, class KH, class V> bool EvictionLFU<K, KH, V>::VictimIterator::operator!=(const VictimIterator& other) const
{
    return !(*this == other);
}

template<class K, class KH, class V> void EvictionLFU<K, KH, V>::clear()
{
    m_buckets.clear();
    m_slots.clear();
}

template<class K, class KH, class V> void EvictionLFU<K, KH, V>::on_insert(const K& key, const CacheEntry& /* entry */)
{
    assert(m_slots.find(std::ref(key)) == m_slots.end());

    m_slots.emplace(std::ref(key), attach(key, INITIAL_FREQUENCY));
}

template<class K, class KH, class V> void EvictionLFU<K, KH, V>::on_update(const K& key, const CacheEntry& /* entry */)
{
    auto slot_it = m_slots.find(std::ref(key));
    assert(slot_it != m_slots.end());

    detach(slot_it->second);
    slot_it->second = attach(key, INITIAL_FREQUENCY);
}

template<class K, class KH, class V> void EvictionLFU<K, KH, V>::on_cache_hit(const K& key, const CacheEntry& /* entry */)
{
    auto slot_it = m_slots.find(std::ref(key));
    if (slot_it == m_slots.end()) {
        // If this is tripped, there is a disconnect between the contents of the policy and the contents of the cache.
        assert(false);
        return;
    }

    const Frequency current = slot_it->second.m_frequency;
    const Frequency next    = current == std::numeric_limits<Frequency>::max() ? current : current + 1;

    detach(slot_it->second);
    slot_it->second = attach(key, next);
}

template<class K, class KH, class V> void EvictionLFU<K, KH, V>::on_evict(const K& key, const CacheEntry& /* entry */)
{
    auto slot_it = m_slots.find(std::ref(key));
    assert(slot_it != m_slots.end());

    detach(slot_it->second);
    m_slots.erase(slot_it);
}

template<class K, class KH, class V> auto EvictionLFU<K, KH, V>::frequency(const K& key) const -> Frequency
{
    auto slot_it = m_slots.find(std::ref(key));
    if (slot_it == m_slots.end()) {
        return 0;
    }
    return slot_it->second.m_frequency;
}

template<class K, class KH, class V> auto EvictionLFU<K, KH, V>::victim_begin() const -> VictimIterator
{
    return VictimIterator{m_buckets.begin(), m_buckets.end()};
}

template<class K, class KH, class V> auto EvictionLFU<K, KH, V>::victim_end() const -> VictimIterator
{
    return VictimIterator{m_buckets.end(), m_buckets.end()};
}

template<class K, class KH, class V> auto EvictionLFU<K, KH, V>::attach(const K& key, Frequency frequency) -> Slot
{
    const KeyIndex index = m_buckets[frequency].push_back(std::ref(key));
    return Slot{frequency, index};
}

template<class K, class KH, class V> void EvictionLFU<K, KH, V>::detach(const Slot& slot)
{
    auto bucket_it = m_buckets.find(slot.m_frequency);
    assert(bucket_it != m_buckets.end());

    bucket_it->second.erase(slot.m_index);
    if (bucket_it->second.empty()) {
        m_buckets.erase(bucket_it);
    }
}

}  // namespace cachet::policy

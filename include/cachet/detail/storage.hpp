#include <cassert>
#include <limits>
#include <type_traits>
#include <utility>

#include "cachet/error.h"
#include "cachet/log.h"

namespace cachet::detail {

template<class K, class V, class KH, class C>
Storage<K, V, KH, C>::Storage(CacheConfig config, C clock)
 : m_config(std::move(config)),
   m_clock(std::move(clock)),
   m_policy(make_policy(m_config.eviction_policy())),
   m_stats(m_config.track_metrics(), m_config.statistics_window_size())
{
}

template<class K, class V, class KH, class C> std::optional<V> Storage<K, V, KH, C>::get(const K& key)
{
    auto it = m_data.find(key);
    if (it == m_data.end()) {
        m_stats.record_miss();
        return std::nullopt;
    }

    const TimePoint now = m_clock.now();
    if (is_expired(it->second, now)) {
        expire(it);
        m_stats.record_miss();
        return std::nullopt;
    }

    CacheEntry& entry        = it->second;
    entry.m_last_accessed_at = now;
    if (entry.m_access_count != std::numeric_limits<uint64_t>::max()) {
        ++entry.m_access_count;
    }

    on_cache_hit(it->first, entry);
    m_stats.record_hit();
    return entry.m_value;
}

template<class K, class V, class KH, class C> absl::Status Storage<K, V, KH, C>::insert(K key, V value)
{
    const TimePoint now = m_clock.now();

    auto it = m_data.find(key);
    if (it != m_data.end()) {
        // Replacing a value restarts its TTL and its access count.
        it->second = CacheEntry{std::move(value), now};
        on_update(it->first, it->second);
        m_stats.record_insertion();
        return absl::OkStatus();
    }

    if (is_full() && !evict_one()) {
        log::logger()->debug("refused insert: cache holds {} entries and has no eviction policy", m_data.size());
        return make_capacity_exceeded(*m_config.max_size());
    }

    const auto it_and_ok = m_data.try_emplace(std::move(key), std::move(value), now);
    assert(it_and_ok.second);

    on_insert(it_and_ok.first->first, it_and_ok.first->second);
    m_stats.record_insertion();
    return absl::OkStatus();
}

template<class K, class V, class KH, class C> absl::StatusOr<V> Storage<K, V, KH, C>::insert_if_absent(K key, V value)
{
    auto it = m_data.find(key);
    if (it != m_data.end() && !is_expired(it->second, m_clock.now())) {
        // Another caller stored a value while ours was being computed. Theirs wins.
        return it->second.m_value;
    }

    V result = value;

    absl::Status status = insert(std::move(key), std::move(value));
    if (!status.ok()) {
        return status;
    }
    return result;
}

template<class K, class V, class KH, class C> bool Storage<K, V, KH, C>::contains(const K& key) const
{
    auto it = m_data.find(key);
    return it != m_data.end() && !is_expired(it->second, m_clock.now());
}

template<class K, class V, class KH, class C> bool Storage<K, V, KH, C>::invalidate(const K& key)
{
    auto it = m_data.find(key);
    if (it == m_data.end()) {
        return false;
    }

    remove(it);
    return true;
}

template<class K, class V, class KH, class C> std::optional<V> Storage<K, V, KH, C>::remove(const K& key)
{
    auto it = m_data.find(key);
    if (it == m_data.end()) {
        return std::nullopt;
    }

    std::optional<V> value;
    if (!is_expired(it->second, m_clock.now())) {
        value = std::move(it->second.m_value);
    }

    remove(it);
    return value;
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::clear()
{
    // Clear the policy first: it holds references to the keys owned by the map.
    std::visit([](auto& policy) { policy.clear(); }, m_policy);

    const size_t removed = m_data.size();
    m_data.clear();

    log::logger()->debug("cleared {} entries", removed);
}

template<class K, class V, class KH, class C> size_t Storage<K, V, KH, C>::cleanup_expired()
{
    if (!m_config.ttl().has_value()) {
        return 0;
    }

    const TimePoint now     = m_clock.now();
    size_t          removed = 0;

    for (auto it = m_data.begin(); it != m_data.end();) {
        if (is_expired(it->second, now)) {
            expire(it++);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        log::logger()->debug("removed {} expired entries", removed);
    }
    return removed;
}

template<class K, class V, class KH, class C> template<typename F> void Storage<K, V, KH, C>::for_each(F&& fn) const
{
    const TimePoint now = m_clock.now();
    for (const auto& [key, entry] : m_data) {
        if (!is_expired(entry, now)) {
            fn(key, entry.m_value);
        }
    }
}

template<class K, class V, class KH, class C> size_t Storage<K, V, KH, C>::size() const
{
    return m_data.size();
}

template<class K, class V, class KH, class C> StatsSnapshot Storage<K, V, KH, C>::stats() const
{
    return m_stats.snapshot(m_data.size(), m_config.max_size());
}

template<class K, class V, class KH, class C> double Storage<K, V, KH, C>::rolling_hit_rate() const
{
    return m_stats.rolling_hit_rate();
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::reset_stats()
{
    m_stats.reset();
}

template<class K, class V, class KH, class C> const CacheConfig& Storage<K, V, KH, C>::config() const
{
    return m_config;
}

template<class K, class V, class KH, class C> auto Storage<K, V, KH, C>::make_policy(EvictionPolicy kind) -> PolicyVariant
{
    switch (kind) {
        case EvictionPolicy::LRU:
            return PolicyVariant{std::in_place_type<policy::EvictionLRU<K, KH, V>>};
        case EvictionPolicy::LFU:
            return PolicyVariant{std::in_place_type<policy::EvictionLFU<K, KH, V>>};
        case EvictionPolicy::FIFO:
            return PolicyVariant{std::in_place_type<policy::EvictionFIFO<K, KH, V>>};
        case EvictionPolicy::Random:
            return PolicyVariant{std::in_place_type<policy::EvictionRandom<K, KH, V>>};
        case EvictionPolicy::None:
            break;
    }
    return PolicyVariant{std::in_place_type<policy::EvictionNone<K, KH, V>>};
}

template<class K, class V, class KH, class C> bool Storage<K, V, KH, C>::is_expired(const CacheEntry& entry, TimePoint now) const
{
    const std::optional<Duration> ttl = m_config.ttl();
    return ttl.has_value() && now - entry.m_inserted_at >= *ttl;
}

template<class K, class V, class KH, class C> bool Storage<K, V, KH, C>::is_full() const
{
    const std::optional<size_t> max_size = m_config.max_size();
    return max_size.has_value() && m_data.size() >= *max_size;
}

template<class K, class V, class KH, class C> bool Storage<K, V, KH, C>::evict_one()
{
    auto victim_it = std::visit([this](const auto& policy) { return find_victim(policy); }, m_policy);
    if (victim_it == m_data.end()) {
        return false;
    }

    remove(victim_it);
    m_stats.record_eviction();

    log::logger()->trace("evicted an entry to make room ({} policy)", to_string(m_config.eviction_policy()));
    return true;
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::expire(DataMapIt it)
{
    remove(it);
    m_stats.record_eviction();
    m_stats.record_expiration();
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::remove(DataMapIt it)
{
    on_evict(it->first, it->second);
    m_data.erase(it);
}

template<class K, class V, class KH, class C> template<typename P> auto Storage<K, V, KH, C>::find_victim(const P& policy) -> DataMapIt
{
    // Policies without victims never make room.
    return boost::hana::if_(
        traits::victim::has_victims<P>,
        [this](const auto& x) {
            auto victim_it = x.victim_begin();
            if (victim_it == x.victim_end()) {
                return m_data.end();
            }

            auto data_it = m_data.find(*victim_it);
            assert(data_it != m_data.end());
            return data_it;
        },
        [this](const auto&) { return m_data.end(); })(policy);
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::on_insert(const K& key, const CacheEntry& entry)
{
    std::visit(
        [&](auto& policy) {
            using Policy = std::decay_t<decltype(policy)>;

            // Call event handler iif the method is defined in the policy.
            boost::hana::if_(
                traits::event::has_on_insert<Policy, K, CacheEntry>, [&](auto& x) { x.on_insert(key, entry); }, [](auto&) {})(policy);
        },
        m_policy);
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::on_update(const K& key, const CacheEntry& entry)
{
    std::visit(
        [&](auto& policy) {
            using Policy = std::decay_t<decltype(policy)>;
            boost::hana::if_(
                traits::event::has_on_update<Policy, K, CacheEntry>, [&](auto& x) { x.on_update(key, entry); }, [](auto&) {})(policy);
        },
        m_policy);
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::on_cache_hit(const K& key, const CacheEntry& entry)
{
    std::visit(
        [&](auto& policy) {
            using Policy = std::decay_t<decltype(policy)>;
            boost::hana::if_(
                traits::event::has_on_cachehit<Policy, K, CacheEntry>, [&](auto& x) { x.on_cache_hit(key, entry); }, [](auto&) {})(policy);
        },
        m_policy);
}

template<class K, class V, class KH, class C> void Storage<K, V, KH, C>::on_evict(const K& key, const CacheEntry& entry)
{
    std::visit(
        [&](auto& policy) {
            using Policy = std::decay_t<decltype(policy)>;
            boost::hana::if_(
                traits::event::has_on_evict<Policy, K, CacheEntry>, [&](auto& x) { x.on_evict(key, entry); }, [](auto&) {})(policy);
        },
        m_policy);
}

}  // namespace cachet::detail

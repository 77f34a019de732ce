#include <utility>
#include <vector>

namespace cachet {

template<class K, class V, class KH, class C>
Cache<K, V, KH, C>::State::State(CacheConfig config, C clock) : m_storage(std::move(config), std::move(clock))
{
}

template<class K, class V, class KH, class C>
Cache<K, V, KH, C>::Cache(CacheConfig config, C clock) : m_state{std::make_shared<State>(std::move(config), std::move(clock))}
{
}

template<class K, class V, class KH, class C> std::optional<V> Cache<K, V, KH, C>::get(const K& key) const
{
    LockGuard guard = lock();
    return m_state->m_storage.get(key);
}

template<class K, class V, class KH, class C> absl::Status Cache<K, V, KH, C>::insert(K key, V value) const
{
    LockGuard guard = lock();
    return m_state->m_storage.insert(std::move(key), std::move(value));
}

template<class K, class V, class KH, class C> bool Cache<K, V, KH, C>::invalidate(const K& key) const
{
    LockGuard guard = lock();
    return m_state->m_storage.invalidate(key);
}

template<class K, class V, class KH, class C> std::optional<V> Cache<K, V, KH, C>::remove(const K& key) const
{
    LockGuard guard = lock();
    return m_state->m_storage.remove(key);
}

template<class K, class V, class KH, class C> bool Cache<K, V, KH, C>::contains(const K& key) const
{
    LockGuard guard = lock();
    return m_state->m_storage.contains(key);
}

template<class K, class V, class KH, class C> void Cache<K, V, KH, C>::clear() const
{
    LockGuard guard = lock();
    m_state->m_storage.clear();
}

template<class K, class V, class KH, class C> size_t Cache<K, V, KH, C>::len() const
{
    LockGuard guard = lock();
    return m_state->m_storage.size();
}

template<class K, class V, class KH, class C> bool Cache<K, V, KH, C>::is_empty() const
{
    return len() == 0;
}

template<class K, class V, class KH, class C> std::optional<size_t> Cache<K, V, KH, C>::capacity() const
{
    // The configuration never changes after construction.
    return m_state->m_storage.config().max_size();
}

template<class K, class V, class KH, class C> StatsSnapshot Cache<K, V, KH, C>::stats() const
{
    LockGuard guard = lock();
    return m_state->m_storage.stats();
}

template<class K, class V, class KH, class C> double Cache<K, V, KH, C>::rolling_hit_rate() const
{
    LockGuard guard = lock();
    return m_state->m_storage.rolling_hit_rate();
}

template<class K, class V, class KH, class C> void Cache<K, V, KH, C>::reset_stats() const
{
    LockGuard guard = lock();
    m_state->m_storage.reset_stats();
}

template<class K, class V, class KH, class C> size_t Cache<K, V, KH, C>::cleanup_expired() const
{
    LockGuard guard = lock();
    return m_state->m_storage.cleanup_expired();
}

template<class K, class V, class KH, class C> template<typename F> void Cache<K, V, KH, C>::for_each(F&& fn) const
{
    std::vector<std::pair<K, V>> items;
    {
        LockGuard guard = lock();
        items.reserve(m_state->m_storage.size());
        m_state->m_storage.for_each([&items](const K& key, const V& value) { items.emplace_back(key, value); });
    }

    for (const auto& [key, value] : items) {
        fn(key, value);
    }
}

template<class K, class V, class KH, class C>
template<typename F>
absl::StatusOr<V> Cache<K, V, KH, C>::get_or_insert_with(const K& key, F&& compute) const
{
    {
        LockGuard guard = lock();
        std::optional<V> cached = m_state->m_storage.get(key);
        if (cached.has_value()) {
            return std::move(*cached);
        }
    }

    V value = std::forward<F>(compute)();

    LockGuard guard = lock();
    return m_state->m_storage.insert_if_absent(key, std::move(value));
}

template<class K, class V, class KH, class C> const CacheConfig& Cache<K, V, KH, C>::config() const
{
    return m_state->m_storage.config();
}

template<class K, class V, class KH, class C> auto Cache<K, V, KH, C>::lock() const -> LockGuard
{
    return LockGuard(m_state->m_mutex);
}

}  // namespace cachet

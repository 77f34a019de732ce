#include <exception>
#include <tuple>
#include <type_traits>
#include <utility>

#include "cachet/log.h"

namespace cachet {

template<class K, class V, class KH, class C>
AsyncCache<K, V, KH, C>::State::State(executor_type executor, CacheConfig config, C clock)
 : m_executor(executor),
   m_strand(boost::asio::make_strand(executor)),
   m_storage(std::move(config), std::move(clock))
{
}

template<class K, class V, class KH, class C>
AsyncCache<K, V, KH, C>::AsyncCache(executor_type executor, CacheConfig config, C clock)
 : m_state{std::make_shared<State>(std::move(executor), std::move(config), std::move(clock))}
{
}

template<class K, class V, class KH, class C> template<typename CompletionToken> auto AsyncCache<K, V, KH, C>::async_get(K key, CompletionToken&& token) const
{
    return initiate<void(std::optional<V>)>([key = std::move(key)](MyStorage& storage) { return storage.get(key); },
                                            std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C>
template<typename CompletionToken>
auto AsyncCache<K, V, KH, C>::async_insert(K key, V value, CompletionToken&& token) const
{
    return initiate<void(absl::Status)>(
        [key = std::move(key), value = std::move(value)](MyStorage& storage) mutable { return storage.insert(std::move(key), std::move(value)); },
        std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C>
template<typename CompletionToken>
auto AsyncCache<K, V, KH, C>::async_invalidate(K key, CompletionToken&& token) const
{
    return initiate<void(bool)>([key = std::move(key)](MyStorage& storage) { return storage.invalidate(key); }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C>
template<typename CompletionToken>
auto AsyncCache<K, V, KH, C>::async_contains(K key, CompletionToken&& token) const
{
    return initiate<void(bool)>([key = std::move(key)](MyStorage& storage) { return storage.contains(key); }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C> template<typename CompletionToken> auto AsyncCache<K, V, KH, C>::async_remove(K key, CompletionToken&& token) const
{
    return initiate<void(std::optional<V>)>([key = std::move(key)](MyStorage& storage) { return storage.remove(key); },
                                            std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C> template<typename CompletionToken> auto AsyncCache<K, V, KH, C>::async_clear(CompletionToken&& token) const
{
    return initiate<void()>([](MyStorage& storage) { storage.clear(); }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C> template<typename CompletionToken> auto AsyncCache<K, V, KH, C>::async_len(CompletionToken&& token) const
{
    return initiate<void(size_t)>([](MyStorage& storage) { return storage.size(); }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C>
template<typename CompletionToken>
auto AsyncCache<K, V, KH, C>::async_is_empty(CompletionToken&& token) const
{
    return initiate<void(bool)>([](MyStorage& storage) { return storage.size() == 0; }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C> template<typename CompletionToken> auto AsyncCache<K, V, KH, C>::async_stats(CompletionToken&& token) const
{
    return initiate<void(StatsSnapshot)>([](MyStorage& storage) { return storage.stats(); }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C>
template<typename CompletionToken>
auto AsyncCache<K, V, KH, C>::async_cleanup_expired(CompletionToken&& token) const
{
    return initiate<void(size_t)>([](MyStorage& storage) { return storage.cleanup_expired(); }, std::forward<CompletionToken>(token));
}

template<class K, class V, class KH, class C>
template<typename Compute, typename CompletionToken>
auto AsyncCache<K, V, KH, C>::async_get_or_insert_with(K key, Compute compute, CompletionToken&& token) const
{
    auto initiation = [](auto handler, StatePtr state, K key, Compute compute) {
        boost::asio::post(state->m_strand, [state, handler = std::move(handler), key = std::move(key), compute = std::move(compute)]() mutable {
            std::optional<V> cached = state->m_storage.get(key);
            if (cached.has_value()) {
                complete(state, std::move(handler), ComputeResult{std::move(*cached)});
                return;
            }

            // Leave the strand: other operations proceed while the value is computed.
            boost::asio::post(state->m_executor, [state, handler = std::move(handler), key = std::move(key), compute = std::move(compute)]() mutable {
                start_compute(state, std::move(handler), std::move(key), std::move(compute));
            });
        });
    };

    return boost::asio::async_initiate<CompletionToken, void(ComputeResult)>(std::move(initiation), token, m_state, std::move(key), std::move(compute));
}

template<class K, class V, class KH, class C> std::optional<size_t> AsyncCache<K, V, KH, C>::capacity() const
{
    return m_state->m_storage.config().max_size();
}

template<class K, class V, class KH, class C> const CacheConfig& AsyncCache<K, V, KH, C>::config() const
{
    return m_state->m_storage.config();
}

template<class K, class V, class KH, class C> auto AsyncCache<K, V, KH, C>::get_executor() const -> executor_type
{
    return m_state->m_executor;
}

template<class K, class V, class KH, class C>
template<typename Signature, typename Operation, typename CompletionToken>
auto AsyncCache<K, V, KH, C>::initiate(Operation operation, CompletionToken&& token) const
{
    auto initiation = [](auto handler, StatePtr state, Operation operation) {
        boost::asio::post(state->m_strand, [state, handler = std::move(handler), operation = std::move(operation)]() mutable {
            if constexpr (std::is_void_v<std::invoke_result_t<Operation&, MyStorage&>>) {
                operation(state->m_storage);
                complete(state, std::move(handler));
            } else {
                complete(state, std::move(handler), operation(state->m_storage));
            }
        });
    };

    return boost::asio::async_initiate<CompletionToken, Signature>(std::move(initiation), token, m_state, std::move(operation));
}

template<class K, class V, class KH, class C>
template<typename Handler, typename Compute>
void AsyncCache<K, V, KH, C>::start_compute(const StatePtr& state, Handler handler, K key, Compute compute)
{
    auto pending = std::make_shared<PendingCompute<Handler>>(state, std::move(handler), std::move(key));

    ComputeCallback callback = [pending](ComputeResult result) { finish_compute(pending, std::move(result)); };

    try {
        compute(std::move(callback));
    } catch (const std::exception& e) {
        log::logger()->debug("compute callback threw: {}", e.what());
        finish_compute(pending, absl::InternalError(e.what()));
    }
}

template<class K, class V, class KH, class C>
template<typename Handler>
void AsyncCache<K, V, KH, C>::finish_compute(const std::shared_ptr<PendingCompute<Handler>>& pending, ComputeResult result)
{
    // Only the first report counts.
    if (pending->m_done.exchange(true)) {
        return;
    }

    const StatePtr& state = pending->m_state;
    if (!result.ok()) {
        complete(state, std::move(pending->m_handler), std::move(result));
        return;
    }

    boost::asio::post(state->m_strand, [pending, value = std::move(*result)]() mutable {
        ComputeResult stored = pending->m_state->m_storage.insert_if_absent(std::move(pending->m_key), std::move(value));
        complete(pending->m_state, std::move(pending->m_handler), std::move(stored));
    });
}

template<class K, class V, class KH, class C>
template<typename Handler, typename... Args>
void AsyncCache<K, V, KH, C>::complete(const StatePtr& state, Handler handler, Args&&... args)
{
    auto executor = boost::asio::get_associated_executor(handler, state->m_executor);
    boost::asio::post(executor, [handler = std::move(handler), args = std::make_tuple(std::forward<Args>(args)...)]() mutable {
        std::apply(std::move(handler), std::move(args));
    });
}

}  // namespace cachet

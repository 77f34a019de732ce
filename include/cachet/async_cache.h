#ifndef CACHET_ASYNC_CACHE_H
#define CACHET_ASYNC_CACHE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include <absl/hash/hash.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <boost/asio.hpp>

#include "clock.h"
#include "config.h"
#include "stats.h"
#include "detail/storage.h"

namespace cachet {

/// @brief Asynchronous flavor of `Cache`, for code running on Boost.Asio executors.
/// @details Every operation is queued on a strand, which plays the role of the cache mutex: the
///          bookkeeping of two operations never overlaps and operations complete in the order they
///          were started. Nothing ever blocks a thread.
///
///          Operations follow the Asio completion token model, so they can complete through a
///          callback, `boost::asio::use_future`, or any other token. Completion handlers are invoked
///          through their associated executor, never from inside the strand.
///
///          Like `Cache`, copies share the same state.
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the cache.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
/// @tparam Clock The time source used for TTL expiry. Defaults to `SteadyClock`.
template<typename Key, typename Value, typename KeyHash = absl::Hash<Key>, typename Clock = SteadyClock> class AsyncCache
{
public:
    using executor_type   = boost::asio::any_io_executor;
    using ComputeResult   = absl::StatusOr<Value>;
    using ComputeCallback = std::function<void(ComputeResult)>;

    /// @brief Create an empty cache.
    /// @param executor The executor running the cache bookkeeping and the `compute` callbacks.
    /// @param config The validated cache configuration.
    /// @param clock The time source to use for TTL expiry.
    AsyncCache(executor_type executor, CacheConfig config, Clock clock = Clock{});

    /// @brief Retrieve an item. Completes with `void(std::optional<Value>)`.
    template<typename CompletionToken> auto async_get(Key key, CompletionToken&& token) const;

    /// @brief Insert or replace an item. Completes with `void(absl::Status)`.
    template<typename CompletionToken> auto async_insert(Key key, Value value, CompletionToken&& token) const;

    /// @brief Remove an item. Completes with `void(bool)`, whether an item was removed.
    template<typename CompletionToken> auto async_invalidate(Key key, CompletionToken&& token) const;

    /// @brief Check whether a live item exists for a key, without touching its counters or recency.
    /// @details Completes with `void(bool)`.
    template<typename CompletionToken> auto async_contains(Key key, CompletionToken&& token) const;

    /// @brief Remove an item and hand it back. Completes with `void(std::optional<Value>)`.
    template<typename CompletionToken> auto async_remove(Key key, CompletionToken&& token) const;

    /// @brief Remove every item. Completes with `void()`.
    template<typename CompletionToken> auto async_clear(CompletionToken&& token) const;

    /// @brief Count the items. Completes with `void(size_t)`.
    template<typename CompletionToken> auto async_len(CompletionToken&& token) const;

    /// @brief Check whether the cache holds no item. Completes with `void(bool)`.
    template<typename CompletionToken> auto async_is_empty(CompletionToken&& token) const;

    /// @brief Snapshot the statistics. Completes with `void(StatsSnapshot)`.
    template<typename CompletionToken> auto async_stats(CompletionToken&& token) const;

    /// @brief Remove every expired item. Completes with `void(size_t)`, the number of items removed.
    template<typename CompletionToken> auto async_cleanup_expired(CompletionToken&& token) const;

    /// @brief Get the item for a key, computing and inserting it if absent.
    /// @details On a miss, `compute` is invoked on the cache executor, outside of the strand, with a
    ///          `ComputeCallback` it must call exactly once with the computed value or an error. The
    ///          value is then stored in a separate strand step; if another operation stored a value for
    ///          the key in the meantime, that value wins.
    ///
    ///          A `compute` that fails (reports an error or throws) completes the operation with the
    ///          error. A `compute` that drops its callback without calling it abandons the operation:
    ///          nothing is stored and the completion handler is destroyed without being invoked.
    ///
    ///          Completes with `void(absl::StatusOr<Value>)`.
    /// @param key The key of the item.
    /// @param compute A callable invoked as `compute(ComputeCallback)`.
    /// @param token The completion token.
    template<typename Compute, typename CompletionToken> auto async_get_or_insert_with(Key key, Compute compute, CompletionToken&& token) const;

    /// @brief Get the configured maximum number of items, empty when unbounded.
    [[nodiscard]] std::optional<size_t> capacity() const;

    [[nodiscard]] const CacheConfig& config() const;
    [[nodiscard]] executor_type      get_executor() const;

private:
    using MyStorage = detail::Storage<Key, Value, KeyHash, Clock>;
    using Strand    = boost::asio::strand<executor_type>;

    struct State {
        State(executor_type executor, CacheConfig config, Clock clock);

        executor_type m_executor;
        Strand        m_strand;
        MyStorage     m_storage;
    };

    using StatePtr = std::shared_ptr<State>;

    /// @brief An in-flight `compute` call, shared by every copy of its callback.
    template<typename Handler> struct PendingCompute {
        PendingCompute(StatePtr state, Handler handler, Key key) : m_state(std::move(state)), m_handler(std::move(handler)), m_key(std::move(key))
        {
        }

        StatePtr          m_state;
        Handler           m_handler;
        Key               m_key;
        std::atomic<bool> m_done{false};
    };

    StatePtr m_state;

    template<typename Signature, typename Operation, typename CompletionToken> auto initiate(Operation operation, CompletionToken&& token) const;

    template<typename Handler, typename Compute> static void start_compute(const StatePtr& state, Handler handler, Key key, Compute compute);

    template<typename Handler> static void finish_compute(const std::shared_ptr<PendingCompute<Handler>>& pending, ComputeResult result);

    template<typename Handler, typename... Args> static void complete(const StatePtr& state, Handler handler, Args&&... args);
};

}  // namespace cachet

#include "async_cache.hpp"

#endif

#ifndef CACHET_EVICTION_RANDOM
#define CACHET_EVICTION_RANDOM

#include <cstdint>
#include <functional>
#include <random>
#include <unordered_map>
#include <vector>

#include "cachet/entry.h"

namespace cachet::policy {

/// @brief Random eviction policy.
/// @details Keys are kept in a flat vector so a victim can be drawn in constant time, with a side
///          map from key to slot so removals can swap the last key into the freed slot.
///
///          The victim walk starts at a uniformly drawn slot and then visits every other key once,
///          wrapping around the vector. Draws come from a generator owned by the policy, seeded from
///          the system clock unless `seed()` is called.
/// @tparam Key The type of the keys used to identify items in the cache.
/// @tparam KeyHash The hasher used for keys.
/// @tparam Value The type of the values stored in the cache.
template<typename Key, typename KeyHash, typename Value> class EvictionRandom
{
private:
    using KeyRef    = std::reference_wrapper<const Key>;
    using KeyVector = std::vector<KeyRef>;
    using SlotMap   = std::unordered_map<KeyRef, size_t, KeyHash, std::equal_to<Key>>;
    using Generator = std::mt19937_64;

public:
    using CacheEntry = cachet::Entry<Value>;

    class VictimIterator
    {
    public:
        VictimIterator(const KeyVector& keys, size_t start, size_t visited);

        const Key&      operator*() const;
        VictimIterator& operator++();
        VictimIterator  operator++(int);
        bool            operator==(const VictimIterator& other) const;
        bool            operator!=(const VictimIterator& other) const;

    private:
        const KeyVector* m_keys;
        size_t           m_start;
        size_t           m_visited;
    };

    EvictionRandom();

    /// @brief Reseed the generator, for reproducible victim draws.
    void seed(uint64_t value);

    void clear();

    void on_insert(const Key& key, const CacheEntry& entry);
    void on_evict(const Key& key, const CacheEntry& entry);

    /// @brief Get an iterator to the first item that should be evicted.
    /// @details Draws a new starting slot on every call.
    [[nodiscard]] VictimIterator victim_begin() const;
    [[nodiscard]] VictimIterator victim_end() const;

private:
    KeyVector         m_keys;
    SlotMap           m_slots;
    mutable Generator m_generator;

    static uint64_t clock_seed();
};

}  // namespace cachet::policy

#include "eviction_random.hpp"

#endif

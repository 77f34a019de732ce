#ifndef CACHET_EVICTION_NONE
#define CACHET_EVICTION_NONE

namespace cachet::policy {

/// @brief Placeholder policy for caches that never evict.
/// @details Keeps no bookkeeping and offers no victims: the cache refuses new keys once full.
template<typename Key, typename KeyHash, typename Value> class EvictionNone
{
public:
    void clear()
    {
    }
};

}  // namespace cachet::policy

#endif

#ifndef CACHET_ENTRY_H
#define CACHET_ENTRY_H

#include <cstdint>
#include <utility>

#include "clock.h"

namespace cachet {

/// @brief A value stored in the cache along with its bookkeeping.
/// @details Policy bookkeeping lives in the eviction policies, not here.
template<typename Value> struct Entry {
    Entry(Value value, TimePoint now) : m_value{std::move(value)}, m_inserted_at{now}, m_last_accessed_at{now}
    {
    }
    Entry(Entry&& other)           = default;
    Entry(const Entry& other)      = delete;
    Entry& operator=(const Entry&) = delete;
    Entry& operator=(Entry&&)      = default;

    Value m_value;  //!< The value stored in cache.

    TimePoint m_inserted_at;       //!< When the value was inserted. Drives TTL expiry.
    TimePoint m_last_accessed_at;  //!< When the value was last read (or inserted).
    uint64_t  m_access_count = 0;  //!< How many reads hit this value since it was inserted.
};

}  // namespace cachet

#endif

#include "cachet/error.h"
#include "cachet/log.h"

#include "cachet/clock.h"
#include "cachet/config.h"
#include "cachet/entry.h"
#include "cachet/stats.h"

#include "cachet/policy/eviction_fifo.h"
#include "cachet/policy/eviction_lfu.h"
#include "cachet/policy/eviction_lru.h"
#include "cachet/policy/eviction_none.h"
#include "cachet/policy/eviction_random.h"

#include "cachet/async_cache.h"
#include "cachet/cache.h"
#include "cachet/utils.h"

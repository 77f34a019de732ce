#include <gtest/gtest.h>

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <absl/hash/hash.h>

#include "cachet/entry.h"
#include "cachet/policy/eviction_fifo.h"

using namespace cachet;

using TestFIFO  = policy::EvictionFIFO<std::string, absl::Hash<std::string>, int32_t>;
using TestEntry = Entry<int32_t>;
using EntryMap  = std::map<std::string, TestEntry>;

namespace {

void insert_item(std::string key, int32_t value, TestFIFO& policy, EntryMap& entry_map)
{
    const auto key_and_entry =
        entry_map.emplace(std::piecewise_construct, std::forward_as_tuple(key), std::forward_as_tuple(value, SteadyClock{}.now())).first;

    policy.on_insert(key_and_entry->first, key_and_entry->second);
}

std::vector<std::string> victims_of(const TestFIFO& policy)
{
    std::vector<std::string> victims;
    for (auto it = policy.victim_begin(); it != policy.victim_end(); ++it) {
        victims.push_back(*it);
    }
    return victims;
}

}  // namespace

TEST(EvictionFIFO, EvictsInInsertionOrder)
{
    TestFIFO policy;
    EntryMap entry_store;

    insert_item("a", 1, policy, entry_store);
    insert_item("b", 2, policy, entry_store);
    insert_item("c", 3, policy, entry_store);

    EXPECT_EQ(victims_of(policy), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(EvictionFIFO, ReinsertMovesToBack)
{
    TestFIFO policy;
    EntryMap entry_store;

    insert_item("a", 1, policy, entry_store);
    insert_item("b", 2, policy, entry_store);
    insert_item("c", 3, policy, entry_store);

    auto key_and_entry = entry_store.find("a");
    policy.on_update(key_and_entry->first, key_and_entry->second);

    EXPECT_EQ(victims_of(policy), (std::vector<std::string>{"b", "c", "a"}));
}

TEST(EvictionFIFO, EvictRemovesKey)
{
    TestFIFO policy;
    EntryMap entry_store;

    insert_item("a", 1, policy, entry_store);
    insert_item("b", 2, policy, entry_store);

    auto key_and_entry = entry_store.find("a");
    policy.on_evict(key_and_entry->first, key_and_entry->second);

    EXPECT_EQ(victims_of(policy), (std::vector<std::string>{"b"}));
}

TEST(EvictionFIFO, Clear)
{
    TestFIFO policy;
    EntryMap entry_store;

    insert_item("a", 1, policy, entry_store);
    policy.clear();

    EXPECT_TRUE(victims_of(policy).empty());
}

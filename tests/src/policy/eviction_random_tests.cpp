#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <absl/hash/hash.h>

#include "cachet/entry.h"
#include "cachet/policy/eviction_random.h"

using namespace cachet;

using TestRandom = policy::EvictionRandom<std::string, absl::Hash<std::string>, int32_t>;
using TestEntry  = Entry<int32_t>;
using EntryMap   = std::map<std::string, TestEntry>;

namespace {

void insert_item(std::string key, int32_t value, TestRandom& policy, EntryMap& entry_map)
{
    const auto key_and_entry =
        entry_map.emplace(std::piecewise_construct, std::forward_as_tuple(key), std::forward_as_tuple(value, SteadyClock{}.now())).first;

    policy.on_insert(key_and_entry->first, key_and_entry->second);
}

std::vector<std::string> victims_of(const TestRandom& policy)
{
    std::vector<std::string> victims;
    for (auto it = policy.victim_begin(); it != policy.victim_end(); ++it) {
        victims.push_back(*it);
    }
    return victims;
}

}  // namespace

TEST(EvictionRandom, EmptyPolicyHasNoVictims)
{
    TestRandom policy;
    EXPECT_TRUE(victims_of(policy).empty());
}

TEST(EvictionRandom, VictimWalkVisitsEveryKeyOnce)
{
    TestRandom policy;
    EntryMap   entry_store;

    insert_item("a", 1, policy, entry_store);
    insert_item("b", 2, policy, entry_store);
    insert_item("c", 3, policy, entry_store);
    insert_item("d", 4, policy, entry_store);

    for (int i = 0; i < 20; ++i) {
        auto victims = victims_of(policy);
        std::sort(victims.begin(), victims.end());
        EXPECT_EQ(victims, (std::vector<std::string>{"a", "b", "c", "d"}));
    }
}

TEST(EvictionRandom, EvictSwapsLastKeyIn)
{
    TestRandom policy;
    EntryMap   entry_store;

    insert_item("a", 1, policy, entry_store);
    insert_item("b", 2, policy, entry_store);
    insert_item("c", 3, policy, entry_store);

    auto key_and_entry = entry_store.find("a");
    policy.on_evict(key_and_entry->first, key_and_entry->second);

    // "c" took over the freed slot and can still be evicted.
    key_and_entry = entry_store.find("c");
    policy.on_evict(key_and_entry->first, key_and_entry->second);

    EXPECT_EQ(victims_of(policy), (std::vector<std::string>{"b"}));
}

TEST(EvictionRandom, SeededDrawsAreReproducible)
{
    TestRandom first;
    TestRandom second;
    EntryMap   entry_store;

    for (const auto& key : {"a", "b", "c", "d", "e", "f"}) {
        insert_item(key, 0, first, entry_store);
        auto key_and_entry = entry_store.find(key);
        second.on_insert(key_and_entry->first, key_and_entry->second);
    }

    first.seed(1234);
    second.seed(1234);

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(*first.victim_begin(), *second.victim_begin());
    }
}

TEST(EvictionRandom, FirstVictimIsUniform)
{
    TestRandom policy;
    EntryMap   entry_store;

    insert_item("a", 1, policy, entry_store);
    insert_item("b", 2, policy, entry_store);
    insert_item("c", 3, policy, entry_store);
    insert_item("d", 4, policy, entry_store);

    policy.seed(42);

    const int                  trials = 4000;
    std::map<std::string, int> counts;
    for (int i = 0; i < trials; ++i) {
        ++counts[*policy.victim_begin()];
    }

    ASSERT_EQ(counts.size(), 4u);
    for (const auto& [key, count] : counts) {
        const double share = static_cast<double>(count) / trials;
        EXPECT_NEAR(share, 0.25, 0.05) << key;
    }
}

TEST(EvictionRandom, Clear)
{
    TestRandom policy;
    EntryMap   entry_store;

    insert_item("a", 1, policy, entry_store);
    policy.clear();

    EXPECT_TRUE(victims_of(policy).empty());
}

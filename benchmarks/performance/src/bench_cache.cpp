#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "cachet.h"

using namespace cachet;

#define CACHET_POLICY_BENCH(test, eviction) \
    BENCHMARK_TEMPLATE(test, eviction)->ArgsProduct({{1, 1000, 10000, 100000}})->Complexity()->UseManualTime()

#define CACHET_BENCH(test)                            \
    CACHET_POLICY_BENCH(test, EvictionPolicy::LRU);  \
    CACHET_POLICY_BENCH(test, EvictionPolicy::LFU);  \
    CACHET_POLICY_BENCH(test, EvictionPolicy::FIFO); \
    CACHET_POLICY_BENCH(test, EvictionPolicy::Random)

using BenchCache = Cache<std::string, std::string>;

std::unique_ptr<BenchCache> setup(EvictionPolicy policy, size_t item_count)
{
    auto config = CacheConfig::builder().max_size(item_count).eviction_policy(policy).build();
    if (!config.ok()) {
        std::cerr << "Benchmark setup failed: " << config.status() << std::endl;
        exit(1);
    }

    auto cache = std::make_unique<BenchCache>(*std::move(config));

    for (size_t i = 0; i < item_count; ++i) {
        const absl::Status status = cache->insert(std::to_string(i), "some_value");
        if (!status.ok()) {
            std::cerr << "Benchmark setup failed: " << status << std::endl;
            exit(1);
        }
    }

    return cache;
}

template<EvictionPolicy Policy> void cache_insert_evicting(benchmark::State& state)
{
    const size_t item_count = state.range(0);
    auto         cache      = setup(Policy, item_count);

    size_t next_key = item_count;
    for (auto _ : state) {
        // Every key is new, so every insert evicts.
        const std::string key = std::to_string(next_key++);

        const auto   start  = std::chrono::high_resolution_clock::now();
        absl::Status status = cache->insert(key, "some cache value");
        const auto   end    = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(status);

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(item_count);
}

CACHET_BENCH(cache_insert_evicting);

template<EvictionPolicy Policy> void cache_get(benchmark::State& state)
{
    const size_t item_count = state.range(0);
    auto         cache      = setup(Policy, item_count);

    for (auto _ : state) {
        const auto start = std::chrono::high_resolution_clock::now();
        auto       value = cache->get("0");
        benchmark::DoNotOptimize(value);
        const auto end = std::chrono::high_resolution_clock::now();

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(item_count);
}

CACHET_BENCH(cache_get);

template<EvictionPolicy Policy> void cache_get_or_insert_with(benchmark::State& state)
{
    const size_t item_count = state.range(0);
    auto         cache      = setup(Policy, item_count);

    size_t i = 0;
    for (auto _ : state) {
        // Alternate between a hit and a miss.
        const std::string key = (i++ % 2 == 0) ? std::string{"0"} : std::to_string(item_count + i);

        const auto start = std::chrono::high_resolution_clock::now();
        auto       value = cache->get_or_insert_with(key, [] { return std::string{"computed value"}; });
        benchmark::DoNotOptimize(value);
        const auto end = std::chrono::high_resolution_clock::now();

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(item_count);
}

CACHET_BENCH(cache_get_or_insert_with);

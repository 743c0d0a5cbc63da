#include "local_bitmap.hpp"
#include <benchmark/benchmark.h>
#include <array>

static std::array<uint8_t, 4> key_of(uint32_t i) {
    return {static_cast<uint8_t>(i >> 24), static_cast<uint8_t>(i >> 16),
            static_cast<uint8_t>(i >> 8), static_cast<uint8_t>(i)};
}

static void BM_SeparateTestAndAdd(benchmark::State& state) {
    BloomFilter f = make_local_bloom_with_estimates(1000000, 0.0001);
    uint32_t i = 0;

    for (auto _ : state) {
        auto key = key_of(i++);
        benchmark::DoNotOptimize(f.test(key.data(), key.size()));
        f.add(key.data(), key.size());
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_CombinedTestAndAdd(benchmark::State& state) {
    BloomFilter f = make_local_bloom_with_estimates(1000000, 0.0001);
    uint32_t i = 0;

    for (auto _ : state) {
        auto key = key_of(i++);
        benchmark::DoNotOptimize(f.test_and_add(key.data(), key.size()));
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_EstimateFalsePositiveRate(benchmark::State& state) {
    const uint64_t n = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        for (double fp = 0.1; fp >= 0.0001; fp /= 10.0) {
            BloomFilter f = make_local_bloom_with_estimates(n, fp);
            benchmark::DoNotOptimize(f.estimate_false_positive_rate(n));
        }
    }
}

BENCHMARK(BM_SeparateTestAndAdd);
BENCHMARK(BM_CombinedTestAndAdd);
BENCHMARK(BM_EstimateFalsePositiveRate)->Arg(100000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();

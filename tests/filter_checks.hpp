#pragma once
// Checks every backend must pass. Each takes a freshly built filter.

#include "bloom.hpp"

#include <array>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

inline std::vector<uint8_t> be32_key(uint32_t x) {
    return {static_cast<uint8_t>(x >> 24), static_cast<uint8_t>(x >> 16),
            static_cast<uint8_t>(x >> 8), static_cast<uint8_t>(x)};
}

// m = 1000, k = 4
inline void check_basic(BloomFilter& f) {
    f.add("Bess");
    f.add("Jane");
    assert(f.test("Bess"));
    assert(f.test("Jane"));
    assert(!f.test("Emma"));
    assert(!f.test_and_add("Emma"));
    assert(f.test("Emma"));
    assert(f.test_and_add("Emma"));
}

// m = 1000, k = 4
inline void check_basic_uint32(BloomFilter& f) {
    f.add(be32_key(100));
    assert(!f.test_and_add(be32_key(102)));
    assert(f.test(be32_key(100)));
    assert(!f.test(be32_key(101)));
    assert(f.test(be32_key(102)));
}

// sized for 1000 entries at 0.001
inline void check_string_keys(BloomFilter& f) {
    f.add("Love");
    assert(!f.test_and_add("in"));
    assert(f.test("Love"));
    assert(!f.test("is"));
    assert(f.test("in"));

    // text keys are hashed as their raw bytes
    const std::string text = "bloom";
    const std::vector<uint8_t> bytes(text.begin(), text.end());
    f.add(bytes);
    assert(f.test(text));
}

inline void check_low_numbers(BloomFilter& f) {
    assert(f.k() == 1);
    assert(f.cap() == 1);
}

// m = 1000, k = 4; readers must never see a false negative
inline void check_concurrent_reads(BloomFilter& f) {
    f.add("Bess");
    f.add("Jane");

    std::atomic<bool> ok{true};
    auto reader = [&](const std::string& key) {
        for (int i = 0; i < 1000 && ok.load(); ++i) {
            if (!f.test(key)) ok.store(false);
        }
    };
    std::thread t1(reader, "Bess");
    std::thread t2(reader, "Jane");
    t1.join();
    t2.join();
    assert(ok.load());
}

// Many callers race test_and_add on the same key; exactly one sees "absent".
// The filter must be large enough that none of the keys is a false positive.
inline void check_test_and_add_race(BloomFilter& f, int threads, int keys) {
    std::vector<std::atomic<int>> absent(static_cast<size_t>(keys));
    for (auto& a : absent) a.store(0);

    std::atomic<int> ready{0};
    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&] {
            ready.fetch_add(1);
            while (ready.load() < threads) std::this_thread::yield();
            for (int k = 0; k < keys; ++k) {
                if (!f.test_and_add("contended-" + std::to_string(k))) absent[k].fetch_add(1);
            }
        });
    }
    for (auto& t : pool) t.join();

    for (const auto& a : absent) assert(a.load() == 1);
}

inline void check_clear_resets(BloomFilter& f) {
    for (uint32_t i = 0; i < 100; ++i) f.add(be32_key(i));
    for (uint32_t i = 0; i < 100; ++i) assert(f.test(be32_key(i)));
    f.clear_all();
    for (uint32_t i = 0; i < 100; ++i) assert(!f.test(be32_key(i)));
}

// Sized with estimate_parameters(n, max_fp).
inline void check_estimated(BloomFilter& f, uint64_t n, double max_fp, size_t max_in_flight) {
    const double rate = f.estimate_false_positive_rate(n, max_in_flight);
    if (rate > 1.5 * max_fp) {
        std::fprintf(stderr, "false positive rate too high: n=%llu m=%llu k=%llu max_fp=%f rate=%f\n",
                     static_cast<unsigned long long>(n), static_cast<unsigned long long>(f.cap()),
                     static_cast<unsigned long long>(f.k()), max_fp, rate);
    }
    assert(rate <= 1.5 * max_fp);

    // estimation leaves the filter empty
    assert(!f.test(be32_key(0)));
}

// Sized for 1000 entries at 0.01; 10,000 disjoint probes.
inline void check_fpp(BloomFilter& f) {
    for (uint32_t i = 0; i < 1000; ++i) f.add(be32_key(i));
    for (uint32_t i = 0; i < 1000; ++i) assert(f.test(be32_key(i)));

    int positives = 0;
    for (uint32_t i = 0; i < 10000; ++i) {
        if (f.test(be32_key(i + 1000))) ++positives;
    }
    assert(positives <= 150);
}

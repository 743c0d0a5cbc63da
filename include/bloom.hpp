#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "bit_storage.hpp"

struct FilterParameters {
    uint64_t m{0}; // bits
    uint64_t k{0}; // hash functions
};

// Optimal m and k for n items at false positive rate p.
// Not floored; backends raise both to at least 1.
FilterParameters estimate_parameters(uint64_t n, double p);

class BloomFilter {
public:
    static constexpr uint32_t kEstimateRounds = 100000;
    static constexpr size_t kMaxInFlight = 1000;
    // probe keys must stay within 32 bits
    static constexpr uint64_t kMaxEstimateEntries = 0xffffffffULL - kEstimateRounds;

    explicit BloomFilter(std::unique_ptr<BitStorage> storage);

    // m, the number of bits
    uint64_t cap() const { return storage_->m(); }
    uint64_t k() const { return storage_->k(); }

    void add(const uint8_t* data, size_t n);
    void add(const std::vector<uint8_t>& data) { add(data.data(), data.size()); }
    void add(const std::string& key);

    // false means definitely absent; true may be a false positive
    bool test(const uint8_t* data, size_t n);
    bool test(const std::vector<uint8_t>& data) { return test(data.data(), data.size()); }
    bool test(const std::string& key);

    // test() then add() with nothing in between; returns the test result
    bool test_and_add(const uint8_t* data, size_t n);
    bool test_and_add(const std::vector<uint8_t>& data) { return test_and_add(data.data(), data.size()); }
    bool test_and_add(const std::string& key);

    void clear_all();

    // Empirical false positive rate after storing n entries: clears the
    // filter, adds keys 0..n-1 and tests kEstimateRounds keys above them, all
    // as 4-byte big-endian, then clears again. At most max_in_flight
    // operations run at once. n above kMaxEstimateEntries throws
    // std::invalid_argument before anything is touched.
    double estimate_false_positive_rate(uint64_t n, size_t max_in_flight = kMaxInFlight);

private:
    std::unique_ptr<BitStorage> storage_;
};

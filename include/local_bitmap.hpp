#pragma once
#include <cstdint>
#include <mutex>
#include <vector>

#include "bit_storage.hpp"
#include "bloom.hpp"

// Larger m (including the saturated estimate) is rejected.
constexpr uint64_t kLocalMaxBits = 1ULL << 63;

// In-process bit array. One mutex covers every k-bit loop, so operations on
// the same instance are linearizable. Nothing is visible to other processes.
class LocalBitmap : public BitStorage {
public:
    // m and k are raised to at least 1; m above kLocalMaxBits throws
    // std::invalid_argument
    LocalBitmap(uint64_t m_bits, uint64_t k_hashes);

    uint64_t m() const override { return m_bits_; }
    uint64_t k() const override { return k_hashes_; }

    void set_all(const HashQuad& h) override;
    bool test_all(const HashQuad& h) override;
    bool test_add_all(const HashQuad& h) override;
    void clear_all() override;

private:
    const uint64_t m_bits_;
    const uint64_t k_hashes_;

    std::mutex mutex_;
    std::vector<uint8_t> bits_; // packed bits

    void set_bit(uint64_t idx);
    bool get_bit(uint64_t idx) const;
};

BloomFilter make_local_bloom(uint64_t m, uint64_t k);
BloomFilter make_local_bloom_with_estimates(uint64_t n, double p);

#include "local_bitmap.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

uint64_t checked_local_bits(uint64_t m) {
    if (m > kLocalMaxBits) {
        throw std::invalid_argument("local bitmap holds at most 2^63 bits, got " + std::to_string(m));
    }
    return std::max<uint64_t>(1, m);
}

} // namespace

LocalBitmap::LocalBitmap(uint64_t m_bits, uint64_t k_hashes)
    : m_bits_(checked_local_bits(m_bits)),
      k_hashes_(std::max<uint64_t>(1, k_hashes)) {
    bits_.assign(static_cast<size_t>(m_bits_ / 8 + (m_bits_ % 8 != 0)), 0);
}

void LocalBitmap::set_bit(uint64_t idx) {
    bits_[idx / 8] |= static_cast<uint8_t>(1u << (idx % 8));
}

bool LocalBitmap::get_bit(uint64_t idx) const {
    return (bits_[idx / 8] & static_cast<uint8_t>(1u << (idx % 8))) != 0;
}

void LocalBitmap::set_all(const HashQuad& h) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint64_t i = 0; i < k_hashes_; ++i) {
        set_bit(location(h, i) % m_bits_);
    }
}

bool LocalBitmap::test_all(const HashQuad& h) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint64_t i = 0; i < k_hashes_; ++i) {
        if (!get_bit(location(h, i) % m_bits_)) return false;
    }
    return true;
}

bool LocalBitmap::test_add_all(const HashQuad& h) {
    bool present = true;
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint64_t i = 0; i < k_hashes_; ++i) {
        const uint64_t idx = location(h, i) % m_bits_;
        if (!get_bit(idx)) present = false;
        set_bit(idx);
    }
    return present;
}

void LocalBitmap::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(bits_.begin(), bits_.end(), 0);
}

BloomFilter make_local_bloom(uint64_t m, uint64_t k) {
    return BloomFilter(std::make_unique<LocalBitmap>(m, k));
}

BloomFilter make_local_bloom_with_estimates(uint64_t n, double p) {
    const FilterParameters fp = estimate_parameters(n, p);
    return make_local_bloom(fp.m, fp.k);
}

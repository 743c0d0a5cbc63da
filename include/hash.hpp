#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

// Four base hash values; every bit location of a key is derived from them.
using HashQuad = std::array<uint64_t, 4>;

// MurmurHash3 x64 128-bit. Returns {h1, h2}.
std::array<uint64_t, 2> murmur3_128(const uint8_t* data, size_t n, uint32_t seed);

// Two 128-bit digests of the same bytes, seeds 0 and 1.
HashQuad base_hashes(const uint8_t* data, size_t n);

// i-th virtual location (enhanced double hashing). Callers reduce it mod m.
// Wraps modulo 2^64; the redis scripts reproduce this exactly.
inline uint64_t location(const HashQuad& h, uint64_t i) {
    return h[i % 2] + i * h[2 + ((i + (i % 2)) % 4) / 2];
}

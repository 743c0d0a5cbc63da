#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "bit_storage.hpp"
#include "bloom.hpp"
#include "redis_conn.hpp"

// Redis bitmaps stop at 2^32 bits; exact location arithmetic in Lua needs
// k * 2^32 to stay below 2^53.
constexpr uint64_t kRedisMaxBits = 1ULL << 32;
constexpr uint64_t kRedisMaxHashes = 1ULL << 20;

// Per-call connection provider. Returning nullptr means no backend.
using ConnectionSource = std::function<std::shared_ptr<RedisConnection>()>;

// Bit array stored as a redis bitmap under key and shared by every process
// using that key. Each k-bit loop is one Lua script, so the server serializes
// operations on the same key. clear_all() deletes the key.
// Goes through a pooled RedisClient; non-integer script results are a
// DataTypeError.
class RedisBitmap : public BitStorage {
public:
    // A null client is accepted; every operation then throws NoBackendError.
    RedisBitmap(uint64_t m_bits, uint64_t k_hashes, std::string key,
                std::shared_ptr<RedisClient> client);

    uint64_t m() const override { return m_bits_; }
    uint64_t k() const override { return k_hashes_; }
    const std::string& key() const { return key_; }

    void set_all(const HashQuad& h) override;
    bool test_all(const HashQuad& h) override;
    bool test_add_all(const HashQuad& h) override;
    void clear_all() override;

private:
    uint64_t m_bits_;
    uint64_t k_hashes_;
    std::string key_;
    std::shared_ptr<RedisClient> client_;

    RedisClient& client() const;
};

// Same scripts as RedisBitmap, but each call borrows a connection from a
// ConnectionSource and coerces the generic reply with redis_int64().
class RedisConnBitmap : public BitStorage {
public:
    RedisConnBitmap(uint64_t m_bits, uint64_t k_hashes, std::string key,
                    ConnectionSource source);

    uint64_t m() const override { return m_bits_; }
    uint64_t k() const override { return k_hashes_; }
    const std::string& key() const { return key_; }

    void set_all(const HashQuad& h) override;
    bool test_all(const HashQuad& h) override;
    bool test_add_all(const HashQuad& h) override;
    void clear_all() override;

private:
    uint64_t m_bits_;
    uint64_t k_hashes_;
    std::string key_;
    ConnectionSource source_;

    std::shared_ptr<RedisConnection> acquire() const;
};

BloomFilter make_redis_bloom(uint64_t m, uint64_t k, const std::string& key,
                             std::shared_ptr<RedisClient> client);
BloomFilter make_redis_bloom_with_estimates(uint64_t n, double p, const std::string& key,
                                            std::shared_ptr<RedisClient> client);

BloomFilter make_redis_conn_bloom(uint64_t m, uint64_t k, const std::string& key,
                                  ConnectionSource source);
BloomFilter make_redis_conn_bloom_with_estimates(uint64_t n, double p, const std::string& key,
                                                 ConnectionSource source);

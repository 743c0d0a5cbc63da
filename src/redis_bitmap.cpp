#include "redis_bitmap.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

// KEYS[1] = bitmap key, ARGV = k, m, h0..h3 (decimal uint64).
// Hashes are split into 32-bit halves so that location(h, i) % m matches the
// in-process value exactly; every intermediate stays below 2^53.
constexpr const char* kPrelude = R"lua(
local key = KEYS[1]
local k = tonumber(ARGV[1])
local m = tonumber(ARGV[2])
local B32 = 4294967296
local function u64(s)
  local hi, lo = 0, 0
  for i = 1, #s do
    lo = lo * 10 + (string.byte(s, i) - 48)
    hi = (hi * 10 + math.floor(lo / B32)) % B32
    lo = lo % B32
  end
  return {hi, lo}
end
local h = {u64(ARGV[3]), u64(ARGV[4]), u64(ARGV[5]), u64(ARGV[6])}
local function loc(i)
  local a = h[(i % 2) + 1]
  local b = h[3 + ((i + (i % 2)) % 4) / 2]
  local lo = a[2] + i * b[2]
  local hi = (a[1] + i * b[1] + math.floor(lo / B32)) % B32
  lo = lo % B32
  local r = hi % m
  r = (r * 65536) % m
  r = (r * 65536) % m
  return (r + lo) % m
end
)lua";

const RedisScript& set_all_script() {
    static const RedisScript script(1, std::string(kPrelude) + R"lua(
for i = 0, k - 1 do
  redis.call('SETBIT', key, loc(i), 1)
end
return 1
)lua");
    return script;
}

const RedisScript& test_all_script() {
    static const RedisScript script(1, std::string(kPrelude) + R"lua(
for i = 0, k - 1 do
  if redis.call('GETBIT', key, loc(i)) == 0 then
    return 0
  end
end
return 1
)lua");
    return script;
}

const RedisScript& test_add_all_script() {
    static const RedisScript script(1, std::string(kPrelude) + R"lua(
local present = 1
for i = 0, k - 1 do
  if redis.call('SETBIT', key, loc(i), 1) == 0 then
    present = 0
  end
end
return present
)lua");
    return script;
}

uint64_t checked_bits(uint64_t m) {
    m = std::max<uint64_t>(1, m);
    if (m > kRedisMaxBits) {
        throw std::invalid_argument("redis bitmap size exceeds 2^32 bits: " + std::to_string(m));
    }
    return m;
}

uint64_t checked_hashes(uint64_t k) {
    k = std::max<uint64_t>(1, k);
    if (k > kRedisMaxHashes) {
        throw std::invalid_argument("too many hash functions for redis bitmap: " + std::to_string(k));
    }
    return k;
}

std::vector<std::string> script_args(uint64_t k, uint64_t m, const HashQuad& h) {
    return {std::to_string(k), std::to_string(m),
            std::to_string(h[0]), std::to_string(h[1]),
            std::to_string(h[2]), std::to_string(h[3])};
}

} // namespace

RedisBitmap::RedisBitmap(uint64_t m_bits, uint64_t k_hashes, std::string key,
                         std::shared_ptr<RedisClient> client)
    : m_bits_(checked_bits(m_bits)),
      k_hashes_(checked_hashes(k_hashes)),
      key_(std::move(key)),
      client_(std::move(client)) {}

RedisClient& RedisBitmap::client() const {
    if (!client_) throw NoBackendError();
    return *client_;
}

void RedisBitmap::set_all(const HashQuad& h) {
    client().run_script(set_all_script(), {key_}, script_args(k_hashes_, m_bits_, h));
}

bool RedisBitmap::test_all(const HashQuad& h) {
    const RedisReply r = client().run_script(test_all_script(), {key_}, script_args(k_hashes_, m_bits_, h));
    return r.as_integer() == 1;
}

bool RedisBitmap::test_add_all(const HashQuad& h) {
    const RedisReply r = client().run_script(test_add_all_script(), {key_}, script_args(k_hashes_, m_bits_, h));
    return r.as_integer() == 1;
}

void RedisBitmap::clear_all() {
    client().del(key_);
}

RedisConnBitmap::RedisConnBitmap(uint64_t m_bits, uint64_t k_hashes, std::string key,
                                 ConnectionSource source)
    : m_bits_(checked_bits(m_bits)),
      k_hashes_(checked_hashes(k_hashes)),
      key_(std::move(key)),
      source_(std::move(source)) {}

std::shared_ptr<RedisConnection> RedisConnBitmap::acquire() const {
    if (!source_) throw NoBackendError();
    auto conn = source_();
    if (!conn) throw NoBackendError();
    return conn;
}

void RedisConnBitmap::set_all(const HashQuad& h) {
    auto conn = acquire();
    set_all_script().run(*conn, {key_}, script_args(k_hashes_, m_bits_, h));
}

bool RedisConnBitmap::test_all(const HashQuad& h) {
    auto conn = acquire();
    return redis_int64(test_all_script().run(*conn, {key_}, script_args(k_hashes_, m_bits_, h))) == 1;
}

bool RedisConnBitmap::test_add_all(const HashQuad& h) {
    auto conn = acquire();
    return redis_int64(test_add_all_script().run(*conn, {key_}, script_args(k_hashes_, m_bits_, h))) == 1;
}

void RedisConnBitmap::clear_all() {
    auto conn = acquire();
    conn->command({"DEL", key_});
}

BloomFilter make_redis_bloom(uint64_t m, uint64_t k, const std::string& key,
                             std::shared_ptr<RedisClient> client) {
    return BloomFilter(std::make_unique<RedisBitmap>(m, k, key, std::move(client)));
}

BloomFilter make_redis_bloom_with_estimates(uint64_t n, double p, const std::string& key,
                                            std::shared_ptr<RedisClient> client) {
    const FilterParameters fp = estimate_parameters(n, p);
    return make_redis_bloom(fp.m, fp.k, key, std::move(client));
}

BloomFilter make_redis_conn_bloom(uint64_t m, uint64_t k, const std::string& key,
                                  ConnectionSource source) {
    return BloomFilter(std::make_unique<RedisConnBitmap>(m, k, key, std::move(source)));
}

BloomFilter make_redis_conn_bloom_with_estimates(uint64_t n, double p, const std::string& key,
                                                 ConnectionSource source) {
    const FilterParameters fp = estimate_parameters(n, p);
    return make_redis_conn_bloom(fp.m, fp.k, key, std::move(source));
}

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One RESP2 value as received from redis.
class RedisReply {
public:
    enum class Type { Nil, Status, Error, Integer, Bulk, Array };

    RedisReply() = default;

    static RedisReply nil() { return RedisReply(); }
    static RedisReply status(std::string s);
    static RedisReply error(std::string s);
    static RedisReply integer(int64_t v);
    static RedisReply bulk(std::string s);
    static RedisReply array(std::vector<RedisReply> elements);

    Type type() const { return type_; }
    bool is_nil() const { return type_ == Type::Nil; }
    bool is_error() const { return type_ == Type::Error; }

    // Status, error and bulk payloads.
    const std::string& str() const { return str_; }
    const std::vector<RedisReply>& elements() const { return elements_; }

    // Strict: throws DataTypeError unless this is an integer reply.
    int64_t as_integer() const;

private:
    Type type_{Type::Nil};
    int64_t integer_{0};
    std::string str_;
    std::vector<RedisReply> elements_;
};

const char* type_name(RedisReply::Type t);

// Lenient coercion: integer replies, or bulk/status text holding a decimal
// integer. Error replies throw ServerError, anything else DataTypeError.
int64_t redis_int64(const RedisReply& reply);

// Encodes a command as a RESP array of bulk strings.
std::string encode_command(const std::vector<std::string>& args);

// Incremental RESP2 parser. Feed raw bytes, then pull complete replies.
class RespReader {
public:
    void feed(const char* data, size_t n);

    // nullopt until a whole reply is buffered. Throws TransportError on
    // malformed input.
    std::optional<RedisReply> next();

    size_t buffered() const { return buf_.size() - pos_; }

private:
    std::string buf_;
    size_t pos_{0};

    static constexpr int64_t kMaxBulkLen = 512LL * 1024 * 1024;

    bool parse(size_t& pos, RedisReply& out) const;
    bool read_line(size_t& pos, std::string& line) const;
    static int64_t parse_int(const std::string& s);
};

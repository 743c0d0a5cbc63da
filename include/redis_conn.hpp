#pragma once
#include <cstddef>
#include <cstdint>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "redis_reply.hpp"

struct RedisOptions {
    std::string host{"127.0.0.1"};
    uint16_t port{6379};
    std::string password;
    int db{0};
    int connect_timeout_ms{2000};
    int io_timeout_ms{5000};
    size_t max_active{64}; // connections handed out at once, 0 = unlimited
    size_t max_idle{64};

    // REDBLOOM_REDIS_ADDR (host:port), REDBLOOM_REDIS_PASSWORD, REDBLOOM_REDIS_DB.
    // Unset variables keep the defaults above.
    static RedisOptions from_env();
};

// A single blocking connection. Not thread-safe; share through RedisPool.
class RedisConnection {
    struct Token {
        explicit Token() = default;
    };

public:
    // Connects, then AUTH / SELECT as configured. Throws TransportError or
    // ServerError.
    static std::unique_ptr<RedisConnection> dial(const RedisOptions& opts);

    RedisConnection(Token, int fd);
    ~RedisConnection();
    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    // Sends one command and waits for its reply. Error replies throw
    // ServerError; I/O failures throw TransportError and mark the
    // connection broken.
    RedisReply command(const std::vector<std::string>& args);

    bool broken() const { return broken_; }

private:
    int fd_{-1};
    bool broken_{false};
    RespReader reader_;

    void write_all(const std::string& data);
    RedisReply read_reply();
};

// Thread-safe set of idle connections. Connections handed out by get() go
// back to the pool when the last shared_ptr drops, unless they broke.
// get() blocks while max_active connections are out.
class RedisPool {
public:
    explicit RedisPool(RedisOptions opts);

    std::shared_ptr<RedisConnection> get();

    size_t idle_count() const;
    size_t active_count() const;
    uint64_t dial_count() const;
    const RedisOptions& options() const { return opts_; }

private:
    struct State {
        std::mutex mu;
        std::condition_variable released;
        std::vector<std::unique_ptr<RedisConnection>> idle;
        size_t max_idle{0};
        size_t max_active{0};
        size_t active{0};
        uint64_t dials{0};
    };

    RedisOptions opts_;
    std::shared_ptr<State> state_;
};

// A Lua script run with EVALSHA, loaded on first use and re-sent with EVAL
// when the server answers NOSCRIPT. After NOSCRIPT the next run loads it again.
class RedisScript {
public:
    RedisScript(int key_count, std::string source);

    RedisReply run(RedisConnection& conn,
                   const std::vector<std::string>& keys,
                   const std::vector<std::string>& args) const;

    const std::string& source() const { return source_; }
    // empty until loaded, and again after a NOSCRIPT reply
    std::string cached_sha1() const;

private:
    int key_count_;
    std::string source_;

    mutable std::mutex mu_;
    mutable std::string sha1_;

    std::vector<std::string> build(const std::string& verb, const std::string& body,
                                   const std::vector<std::string>& keys,
                                   const std::vector<std::string>& args) const;
};

// Pooled client, safe to share between threads.
class RedisClient {
public:
    explicit RedisClient(RedisOptions opts);

    RedisReply command(const std::vector<std::string>& args);
    RedisReply run_script(const RedisScript& script,
                          const std::vector<std::string>& keys,
                          const std::vector<std::string>& args);

    int64_t del(const std::string& key);
    void ping();

    RedisPool& pool() { return pool_; }

private:
    RedisPool pool_;
};

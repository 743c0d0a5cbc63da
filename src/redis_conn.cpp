#include "redis_conn.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

// Non-blocking connect bounded by timeout_ms. Returns the fd in blocking
// mode, or -1 with err filled in.
int connect_with_timeout(const addrinfo* ai, int timeout_ms, std::string& err) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
        err = std::strerror(errno);
        return -1;
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        err = std::strerror(errno);
        ::close(fd);
        return -1;
    }

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno != EINPROGRESS) {
        err = std::strerror(errno);
        ::close(fd);
        return -1;
    }

    if (rc != 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        rc = ::poll(&pfd, 1, timeout_ms);
        if (rc <= 0) {
            err = rc == 0 ? "connect timeout" : std::strerror(errno);
            ::close(fd);
            return -1;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            err = std::strerror(so_error ? so_error : errno);
            ::close(fd);
            return -1;
        }
    }

    if (::fcntl(fd, F_SETFL, flags) < 0) {
        err = std::strerror(errno);
        ::close(fd);
        return -1;
    }

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
}

void set_io_timeout(int fd, int timeout_ms) {
    if (timeout_ms <= 0) return;
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

int parse_env_int(const char* name, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || errno == ERANGE || end != value.c_str() + value.size()) {
        throw std::invalid_argument(std::string(name) + ": not a number: " + value);
    }
    return static_cast<int>(v);
}

} // namespace

RedisOptions RedisOptions::from_env() {
    RedisOptions opts;

    if (const char* addr = std::getenv("REDBLOOM_REDIS_ADDR")) {
        const std::string s(addr);
        const size_t colon = s.rfind(':');
        if (colon == std::string::npos) {
            opts.host = s;
        } else {
            opts.host = s.substr(0, colon);
            const int port = parse_env_int("REDBLOOM_REDIS_ADDR", s.substr(colon + 1));
            if (port <= 0 || port > 65535) {
                throw std::invalid_argument("REDBLOOM_REDIS_ADDR: port out of range: " + s);
            }
            opts.port = static_cast<uint16_t>(port);
        }
    }
    if (const char* pass = std::getenv("REDBLOOM_REDIS_PASSWORD")) {
        opts.password = pass;
    }
    if (const char* db = std::getenv("REDBLOOM_REDIS_DB")) {
        opts.db = parse_env_int("REDBLOOM_REDIS_DB", db);
    }
    return opts;
}

std::unique_ptr<RedisConnection> RedisConnection::dial(const RedisOptions& opts) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string port = std::to_string(opts.port);
    addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(opts.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        throw TransportError("resolve " + opts.host + ": " + ::gai_strerror(rc));
    }

    std::string err = "no address";
    int fd = -1;
    for (const addrinfo* ai = res; ai != nullptr && fd < 0; ai = ai->ai_next) {
        fd = connect_with_timeout(ai, opts.connect_timeout_ms, err);
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        throw TransportError("dial " + opts.host + ":" + port + ": " + err);
    }
    set_io_timeout(fd, opts.io_timeout_ms);

    auto conn = std::make_unique<RedisConnection>(Token{}, fd);
    if (!opts.password.empty()) conn->command({"AUTH", opts.password});
    if (opts.db != 0) conn->command({"SELECT", std::to_string(opts.db)});
    return conn;
}

RedisConnection::RedisConnection(Token, int fd) : fd_(fd) {}

RedisConnection::~RedisConnection() {
    if (fd_ >= 0) ::close(fd_);
}

void RedisConnection::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t r = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (r < 0) {
            if (errno == EINTR) continue;
            broken_ = true;
            if (errno == EAGAIN || errno == EWOULDBLOCK) throw TransportError("redis write timeout");
            throw TransportError(std::string("redis write: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(r);
    }
}

RedisReply RedisConnection::read_reply() {
    char buf[16 * 1024];
    while (true) {
        try {
            if (auto reply = reader_.next()) return std::move(*reply);
        } catch (const TransportError&) {
            broken_ = true;
            throw;
        }

        const ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
        if (r == 0) {
            broken_ = true;
            throw TransportError("redis connection closed by peer");
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            broken_ = true;
            if (errno == EAGAIN || errno == EWOULDBLOCK) throw TransportError("redis read timeout");
            throw TransportError(std::string("redis read: ") + std::strerror(errno));
        }
        reader_.feed(buf, static_cast<size_t>(r));
    }
}

RedisReply RedisConnection::command(const std::vector<std::string>& args) {
    if (broken_) throw TransportError("redis connection is broken");
    write_all(encode_command(args));
    RedisReply reply = read_reply();
    if (reply.is_error()) throw ServerError(reply.str());
    return reply;
}

RedisPool::RedisPool(RedisOptions opts)
    : opts_(std::move(opts)),
      state_(std::make_shared<State>()) {
    state_->max_idle = opts_.max_idle;
    state_->max_active = opts_.max_active;
}

std::shared_ptr<RedisConnection> RedisPool::get() {
    std::unique_ptr<RedisConnection> conn;
    {
        std::unique_lock<std::mutex> lk(state_->mu);
        state_->released.wait(lk, [this] {
            return state_->max_active == 0 || state_->active < state_->max_active;
        });
        ++state_->active;
        if (!state_->idle.empty()) {
            conn = std::move(state_->idle.back());
            state_->idle.pop_back();
        }
    }

    if (!conn) {
        try {
            conn = RedisConnection::dial(opts_);
        } catch (...) {
            // give the slot back before the error reaches the caller
            std::lock_guard<std::mutex> lk(state_->mu);
            --state_->active;
            state_->released.notify_one();
            throw;
        }
        std::lock_guard<std::mutex> lk(state_->mu);
        ++state_->dials;
    }

    std::weak_ptr<State> weak = state_;
    return std::shared_ptr<RedisConnection>(conn.release(), [weak](RedisConnection* c) {
        std::unique_ptr<RedisConnection> owned(c);
        auto st = weak.lock();
        if (!st) return;
        std::lock_guard<std::mutex> lk(st->mu);
        --st->active;
        if (!owned->broken() && st->idle.size() < st->max_idle) st->idle.push_back(std::move(owned));
        st->released.notify_one();
    });
}

size_t RedisPool::idle_count() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->idle.size();
}

size_t RedisPool::active_count() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->active;
}

uint64_t RedisPool::dial_count() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->dials;
}

RedisScript::RedisScript(int key_count, std::string source)
    : key_count_(key_count), source_(std::move(source)) {}

std::vector<std::string> RedisScript::build(const std::string& verb, const std::string& body,
                                            const std::vector<std::string>& keys,
                                            const std::vector<std::string>& args) const {
    std::vector<std::string> cmd;
    cmd.reserve(3 + keys.size() + args.size());
    cmd.push_back(verb);
    cmd.push_back(body);
    cmd.push_back(std::to_string(key_count_));
    cmd.insert(cmd.end(), keys.begin(), keys.end());
    cmd.insert(cmd.end(), args.begin(), args.end());
    return cmd;
}

RedisReply RedisScript::run(RedisConnection& conn,
                            const std::vector<std::string>& keys,
                            const std::vector<std::string>& args) const {
    if (keys.size() != static_cast<size_t>(key_count_)) {
        throw std::invalid_argument("script expects " + std::to_string(key_count_) + " keys");
    }

    std::string sha;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sha = sha1_;
    }
    if (sha.empty()) {
        const RedisReply loaded = conn.command({"SCRIPT", "LOAD", source_});
        if (loaded.type() != RedisReply::Type::Bulk) {
            throw DataTypeError(std::string("SCRIPT LOAD returned ") + type_name(loaded.type()));
        }
        sha = loaded.str();
        std::lock_guard<std::mutex> lk(mu_);
        sha1_ = sha;
    }

    try {
        return conn.command(build("EVALSHA", sha, keys, args));
    } catch (const ServerError& e) {
        // script cache flushed or a different server behind the same address
        if (std::strncmp(e.what(), "NOSCRIPT", 8) != 0) throw;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (sha1_ == sha) sha1_.clear();
    }
    return conn.command(build("EVAL", source_, keys, args));
}

std::string RedisScript::cached_sha1() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sha1_;
}

RedisClient::RedisClient(RedisOptions opts) : pool_(std::move(opts)) {}

RedisReply RedisClient::command(const std::vector<std::string>& args) {
    auto conn = pool_.get();
    return conn->command(args);
}

RedisReply RedisClient::run_script(const RedisScript& script,
                                   const std::vector<std::string>& keys,
                                   const std::vector<std::string>& args) {
    auto conn = pool_.get();
    return script.run(*conn, keys, args);
}

int64_t RedisClient::del(const std::string& key) {
    return command({"DEL", key}).as_integer();
}

void RedisClient::ping() {
    const RedisReply r = command({"PING"});
    if (r.type() != RedisReply::Type::Status || r.str() != "PONG") {
        throw DataTypeError(std::string("unexpected PING reply: ") + type_name(r.type()));
    }
}

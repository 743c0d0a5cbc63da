#include "redis_reply.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstdlib>

RedisReply RedisReply::status(std::string s) {
    RedisReply r;
    r.type_ = Type::Status;
    r.str_ = std::move(s);
    return r;
}

RedisReply RedisReply::error(std::string s) {
    RedisReply r;
    r.type_ = Type::Error;
    r.str_ = std::move(s);
    return r;
}

RedisReply RedisReply::integer(int64_t v) {
    RedisReply r;
    r.type_ = Type::Integer;
    r.integer_ = v;
    return r;
}

RedisReply RedisReply::bulk(std::string s) {
    RedisReply r;
    r.type_ = Type::Bulk;
    r.str_ = std::move(s);
    return r;
}

RedisReply RedisReply::array(std::vector<RedisReply> elements) {
    RedisReply r;
    r.type_ = Type::Array;
    r.elements_ = std::move(elements);
    return r;
}

int64_t RedisReply::as_integer() const {
    if (type_ != Type::Integer) {
        throw DataTypeError(std::string("expected integer, got ") + type_name(type_));
    }
    return integer_;
}

const char* type_name(RedisReply::Type t) {
    switch (t) {
    case RedisReply::Type::Nil: return "nil";
    case RedisReply::Type::Status: return "status";
    case RedisReply::Type::Error: return "error";
    case RedisReply::Type::Integer: return "integer";
    case RedisReply::Type::Bulk: return "bulk";
    case RedisReply::Type::Array: return "array";
    }
    return "unknown";
}

int64_t redis_int64(const RedisReply& reply) {
    switch (reply.type()) {
    case RedisReply::Type::Integer:
        return reply.as_integer();
    case RedisReply::Type::Bulk:
    case RedisReply::Type::Status: {
        const std::string& s = reply.str();
        if (s.empty()) throw DataTypeError("empty string is not an integer");
        errno = 0;
        char* end = nullptr;
        const long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno == ERANGE || end != s.c_str() + s.size()) {
            throw DataTypeError("not an integer: " + s);
        }
        return static_cast<int64_t>(v);
    }
    case RedisReply::Type::Error:
        throw ServerError(reply.str());
    default:
        throw DataTypeError(std::string("unexpected ") + type_name(reply.type()) + " reply");
    }
}

std::string encode_command(const std::vector<std::string>& args) {
    std::string out;
    out += "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a;
        out += "\r\n";
    }
    return out;
}

void RespReader::feed(const char* data, size_t n) {
    // drop consumed prefix before growing
    if (pos_ > 0 && pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    } else if (pos_ > 4096) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    buf_.append(data, n);
}

std::optional<RedisReply> RespReader::next() {
    size_t pos = pos_;
    RedisReply out;
    if (!parse(pos, out)) return std::nullopt;
    pos_ = pos;
    return out;
}

bool RespReader::read_line(size_t& pos, std::string& line) const {
    const size_t eol = buf_.find("\r\n", pos);
    if (eol == std::string::npos) return false;
    line.assign(buf_, pos, eol - pos);
    pos = eol + 2;
    return true;
}

int64_t RespReader::parse_int(const std::string& s) {
    if (s.empty()) throw TransportError("protocol error: empty integer");
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size()) {
        throw TransportError("protocol error: bad integer '" + s + "'");
    }
    return static_cast<int64_t>(v);
}

bool RespReader::parse(size_t& pos, RedisReply& out) const {
    if (pos >= buf_.size()) return false;

    const char prefix = buf_[pos];
    size_t p = pos + 1;
    std::string line;
    if (!read_line(p, line)) return false;

    switch (prefix) {
    case '+':
        out = RedisReply::status(line);
        break;
    case '-':
        out = RedisReply::error(line);
        break;
    case ':':
        out = RedisReply::integer(parse_int(line));
        break;
    case '$': {
        const int64_t len = parse_int(line);
        if (len == -1) {
            out = RedisReply::nil();
            break;
        }
        if (len < 0 || len > kMaxBulkLen) throw TransportError("protocol error: bad bulk length");
        const size_t n = static_cast<size_t>(len);
        if (buf_.size() - p < n + 2) return false;
        if (buf_.compare(p + n, 2, "\r\n") != 0) throw TransportError("protocol error: bulk not terminated");
        out = RedisReply::bulk(buf_.substr(p, n));
        p += n + 2;
        break;
    }
    case '*': {
        const int64_t count = parse_int(line);
        if (count == -1) {
            out = RedisReply::nil();
            break;
        }
        if (count < 0) throw TransportError("protocol error: bad array length");
        std::vector<RedisReply> elements;
        for (int64_t i = 0; i < count; ++i) {
            RedisReply e;
            if (!parse(p, e)) return false;
            elements.push_back(std::move(e));
        }
        out = RedisReply::array(std::move(elements));
        break;
    }
    default:
        throw TransportError(std::string("protocol error: unexpected reply prefix '") + prefix + "'");
    }

    pos = p;
    return true;
}

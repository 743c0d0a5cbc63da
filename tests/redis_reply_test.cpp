#include "errors.hpp"
#include "redis_reply.hpp"

#include <cassert>
#include <string>

static RedisReply parse_one(const std::string& wire) {
    RespReader r;
    r.feed(wire.data(), wire.size());
    auto reply = r.next();
    assert(reply.has_value());
    assert(r.buffered() == 0);
    return *reply;
}

template <typename E, typename F>
static bool throws(F fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    assert(encode_command({"SET", "k", "v"}) == "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$1\r\nv\r\n");
    assert(encode_command({"GET", ""}) == "*2\r\n$3\r\nGET\r\n$0\r\n\r\n");

    // scalar types
    {
        auto s = parse_one("+OK\r\n");
        assert(s.type() == RedisReply::Type::Status && s.str() == "OK");

        auto e = parse_one("-NOSCRIPT No matching script\r\n");
        assert(e.is_error() && e.str() == "NOSCRIPT No matching script");

        auto i = parse_one(":-42\r\n");
        assert(i.as_integer() == -42);

        auto b = parse_one("$5\r\na\r\nbc\r\n");
        assert(b.type() == RedisReply::Type::Bulk && b.str() == "a\r\nbc");

        assert(parse_one("$-1\r\n").is_nil());
        assert(parse_one("*-1\r\n").is_nil());
        assert(parse_one("$0\r\n\r\n").str().empty());
    }

    // nested array delivered one byte at a time
    {
        const std::string wire = "*3\r\n:1\r\n*2\r\n$3\r\nfoo\r\n$-1\r\n+PONG\r\n";
        RespReader r;
        for (size_t i = 0; i + 1 < wire.size(); ++i) {
            r.feed(&wire[i], 1);
            assert(!r.next().has_value());
        }
        r.feed(&wire[wire.size() - 1], 1);
        auto reply = r.next();
        assert(reply.has_value());
        assert(reply->type() == RedisReply::Type::Array);
        const auto& el = reply->elements();
        assert(el.size() == 3);
        assert(el[0].as_integer() == 1);
        assert(el[1].elements().size() == 2);
        assert(el[1].elements()[0].str() == "foo");
        assert(el[1].elements()[1].is_nil());
        assert(el[2].str() == "PONG");
    }

    // pipelined replies come out in order
    {
        RespReader r;
        const std::string wire = ":1\r\n:0\r\n";
        r.feed(wire.data(), wire.size());
        assert(r.next()->as_integer() == 1);
        assert(r.next()->as_integer() == 0);
        assert(!r.next().has_value());
    }

    // malformed framing
    {
        assert(throws<TransportError>([] { parse_one("?x\r\n"); }));
        assert(throws<TransportError>([] { parse_one(":12a\r\n"); }));
        assert(throws<TransportError>([] { parse_one("$3\r\nabcd\r\n"); }));
        assert(throws<TransportError>([] { parse_one("$-5\r\n"); }));
    }

    // strict coercion
    {
        assert(throws<DataTypeError>([] { RedisReply::bulk("1").as_integer(); }));
        assert(throws<DataTypeError>([] { RedisReply::nil().as_integer(); }));
        assert(RedisReply::integer(7).as_integer() == 7);
    }

    // lenient coercion
    {
        assert(redis_int64(RedisReply::integer(5)) == 5);
        assert(redis_int64(RedisReply::bulk("42")) == 42);
        assert(redis_int64(RedisReply::status("-7")) == -7);
        assert(throws<DataTypeError>([] { redis_int64(RedisReply::bulk("4x")); }));
        assert(throws<DataTypeError>([] { redis_int64(RedisReply::bulk("")); }));
        assert(throws<DataTypeError>([] { redis_int64(RedisReply::nil()); }));
        assert(throws<DataTypeError>([] { redis_int64(RedisReply::array({})); }));
        assert(throws<ServerError>([] { redis_int64(RedisReply::error("ERR boom")); }));
    }

    return 0;
}

#pragma once

#include <stdexcept>
#include <string>

// Base for every failure surfaced by a filter or its backend.
class BloomError : public std::runtime_error {
public:
    explicit BloomError(const std::string& what) : std::runtime_error(what) {}
};

// A remote backend was used without a client or connection.
class NoBackendError : public BloomError {
public:
    NoBackendError() : BloomError("no redis client error") {}
};

// A reply could not be coerced to the expected type.
class DataTypeError : public BloomError {
public:
    explicit DataTypeError(const std::string& what) : BloomError("result data type error: " + what) {}
};

// Dial, send, receive, timeout and framing failures.
class TransportError : public BloomError {
public:
    explicit TransportError(const std::string& what) : BloomError(what) {}
};

// Redis answered with an error reply; the message is the server's text.
class ServerError : public BloomError {
public:
    explicit ServerError(const std::string& what) : BloomError(what) {}
};

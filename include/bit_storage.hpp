#pragma once
#include <cstdint>

#include "hash.hpp"

// Bit array behind a filter. Each call touches the k bits at
// location(h, i) % m for i in [0, k) and applies all of them or none.
class BitStorage {
public:
    virtual ~BitStorage() = default;

    virtual uint64_t m() const = 0;
    virtual uint64_t k() const = 0;

    virtual void set_all(const HashQuad& h) = 0;
    virtual bool test_all(const HashQuad& h) = 0;

    // Returns whether all k bits were already set, and sets them, as one step.
    virtual bool test_add_all(const HashQuad& h) = 0;

    virtual void clear_all() = 0;
};

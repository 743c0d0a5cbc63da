#include "errors.hpp"
#include "local_bitmap.hpp"
#include "redis_bitmap.hpp"

#include <cstdlib>
#include <iostream>

static void exercise(BloomFilter& f, const char* label) {
    f.add("name");
    f.add("role");

    std::cout << label << ": m=" << f.cap() << " k=" << f.k() << "\n";
    std::cout << "  name -> " << (f.test("name") ? "maybe" : "absent") << "\n";
    std::cout << "  salary -> " << (f.test("salary") ? "maybe" : "absent") << "\n";
    std::cout << "  first test_and_add(salary) -> " << f.test_and_add("salary") << "\n";
    std::cout << "  second test_and_add(salary) -> " << f.test_and_add("salary") << "\n";
    std::cout << "  estimated fp rate at n=1000: " << f.estimate_false_positive_rate(1000) << "\n";
}

int main() {
    {
        BloomFilter f = make_local_bloom_with_estimates(1000, 0.01);
        exercise(f, "local");
    }

    // redis only when an address is configured
    if (std::getenv("REDBLOOM_REDIS_ADDR") == nullptr) return 0;

    try {
        auto client = std::make_shared<RedisClient>(RedisOptions::from_env());
        BloomFilter f = make_redis_bloom_with_estimates(1000, 0.01, "redbloom:demo", client);
        exercise(f, "redis");
        f.clear_all();
    } catch (const BloomError& e) {
        std::cerr << "redis: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

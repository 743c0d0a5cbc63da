#include "bloom.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <exception>
#include <functional>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

using namespace std;

namespace {

// Non-finite or non-positive estimates collapse to 0; callers floor to 1.
uint64_t to_count(double x) {
    if (!std::isfinite(x) || x <= 0.0) return 0;
    if (x >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(x);
}

std::array<uint8_t, 4> be32(uint32_t x) {
    return {static_cast<uint8_t>(x >> 24), static_cast<uint8_t>(x >> 16),
            static_cast<uint8_t>(x >> 8), static_cast<uint8_t>(x)};
}

// Runs fn(i) for i in [0, count) on at most max_in_flight threads and returns
// once every call has finished. The first exception stops the remaining work
// and is rethrown here.
void run_bounded(uint64_t count, size_t max_in_flight, const std::function<void(uint64_t)>& fn) {
    if (count == 0) return;
    const uint64_t workers = std::min<uint64_t>(count, std::max<size_t>(max_in_flight, 1));

    std::atomic<uint64_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr error;
    std::mutex error_mu;

    auto worker = [&] {
        while (!failed.load()) {
            const uint64_t i = next.fetch_add(1);
            if (i >= count) return;
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lk(error_mu);
                if (!error) error = std::current_exception();
                failed.store(true);
                return;
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    try {
        for (uint64_t w = 0; w < workers; ++w) pool.emplace_back(worker);
    } catch (const std::system_error&) {
        // thread limit reached; the running workers drain the remaining indices
        if (pool.empty()) throw;
    }
    for (auto& t : pool) t.join();

    if (error) std::rethrow_exception(error);
}

} // namespace

FilterParameters estimate_parameters(uint64_t n, double p) {
    const double ln2 = std::log(2.0);
    const double nd = static_cast<double>(n);

    FilterParameters fp;
    fp.m = to_count(std::ceil(-1.0 * nd * std::log(p) / (ln2 * ln2)));
    if (n == 0) return fp; // k would divide by zero
    fp.k = to_count(std::ceil(ln2 * static_cast<double>(fp.m) / nd));
    return fp;
}

BloomFilter::BloomFilter(std::unique_ptr<BitStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) throw std::invalid_argument("BloomFilter requires a bit storage");
}

void BloomFilter::add(const uint8_t* data, size_t n) {
    storage_->set_all(base_hashes(data, n));
}

void BloomFilter::add(const std::string& key) {
    add(reinterpret_cast<const uint8_t*>(key.data()), key.size());
}

bool BloomFilter::test(const uint8_t* data, size_t n) {
    return storage_->test_all(base_hashes(data, n));
}

bool BloomFilter::test(const std::string& key) {
    return test(reinterpret_cast<const uint8_t*>(key.data()), key.size());
}

bool BloomFilter::test_and_add(const uint8_t* data, size_t n) {
    return storage_->test_add_all(base_hashes(data, n));
}

bool BloomFilter::test_and_add(const std::string& key) {
    return test_and_add(reinterpret_cast<const uint8_t*>(key.data()), key.size());
}

void BloomFilter::clear_all() {
    storage_->clear_all();
}

double BloomFilter::estimate_false_positive_rate(uint64_t n, size_t max_in_flight) {
    if (n > kMaxEstimateEntries) {
        throw std::invalid_argument("estimate_false_positive_rate: n above " +
                                    std::to_string(kMaxEstimateEntries));
    }
    clear_all();

    run_bounded(n, max_in_flight, [this](uint64_t i) {
        const auto key = be32(static_cast<uint32_t>(i));
        add(key.data(), key.size());
    });

    // keys from n + 1 upward were never added
    std::atomic<uint32_t> positives{0};
    run_bounded(kEstimateRounds, max_in_flight, [this, n, &positives](uint64_t i) {
        const auto key = be32(static_cast<uint32_t>(i + n + 1));
        if (test(key.data(), key.size())) positives.fetch_add(1);
    });

    const double rate = static_cast<double>(positives.load()) / static_cast<double>(kEstimateRounds);
    clear_all();
    return rate;
}

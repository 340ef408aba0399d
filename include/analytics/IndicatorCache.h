#pragma once

#include "analytics/TechnicalIndicators.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace quantcore {
namespace analytics {

// Any result an indicator can produce
using IndicatorValue = std::variant<double, MACDResult, StochasticResult, ADXResult, BollingerBandsResult>;

// TTL cache with single-flight semantics: while a key is being computed,
// other callers for the same key wait on the same shared future.
// Failed computations are dropped so the next caller retries.
class IndicatorCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t computations;
        uint64_t failures;

        Stats() : hits(0), misses(0), computations(0), failures(0) {}
    };

    explicit IndicatorCache(std::chrono::milliseconds ttl = std::chrono::seconds(60));

    IndicatorValue getOrCompute(const std::string& key,
                                const std::function<IndicatorValue()>& compute);

    void clear();
    size_t size() const;
    // Drops entries whose TTL elapsed. Pending entries are kept.
    size_t purgeExpired();

    void setTtl(std::chrono::milliseconds ttl);
    std::chrono::milliseconds ttl() const;

    Stats stats() const;

private:
    struct Entry {
        std::shared_future<IndicatorValue> future;
        Clock::time_point expires_at;
        uint64_t generation;
        bool pending;
    };

    size_t purgeExpiredLocked(Clock::time_point now);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::chrono::milliseconds ttl_;
    uint64_t next_generation_;
    Stats stats_;
};

} // namespace analytics
} // namespace quantcore

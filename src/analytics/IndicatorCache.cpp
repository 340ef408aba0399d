#include "analytics/IndicatorCache.h"

namespace quantcore {
namespace analytics {

namespace {
constexpr size_t kPurgeThreshold = 4096;
}

IndicatorCache::IndicatorCache(std::chrono::milliseconds ttl)
    : ttl_(ttl)
    , next_generation_(1)
{
}

IndicatorValue IndicatorCache::getOrCompute(
    const std::string& key,
    const std::function<IndicatorValue()>& compute
) {
    std::promise<IndicatorValue> promise;
    std::shared_future<IndicatorValue> future;
    uint64_t generation = 0;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();

        auto it = entries_.find(key);
        if (it != entries_.end() && (it->second.pending || now < it->second.expires_at)) {
            ++stats_.hits;
            future = it->second.future;
        } else {
            ++stats_.misses;
            if (entries_.size() >= kPurgeThreshold) {
                purgeExpiredLocked(now);
            }

            future = promise.get_future().share();
            generation = next_generation_++;
            entries_[key] = Entry{future, now + ttl_, generation, true};
            owner = true;
        }
    }

    // Waiters block here; exceptions from the owner propagate through get()
    if (!owner) {
        return future.get();
    }

    try {
        IndicatorValue value = compute();
        promise.set_value(value);

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.computations;
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.generation == generation) {
            it->second.pending = false;
            it->second.expires_at = Clock::now() + ttl_;
        }
        return value;
    } catch (...) {
        promise.set_exception(std::current_exception());

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failures;
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.generation == generation) {
            entries_.erase(it);
        }
        throw;
    }
}

void IndicatorCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t IndicatorCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t IndicatorCache::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return purgeExpiredLocked(Clock::now());
}

size_t IndicatorCache::purgeExpiredLocked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!it->second.pending && now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void IndicatorCache::setTtl(std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    ttl_ = ttl;
}

std::chrono::milliseconds IndicatorCache::ttl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ttl_;
}

IndicatorCache::Stats IndicatorCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace analytics
} // namespace quantcore

#include "analytics/OrderBookStore.h"
#include "common/Logger.h"

namespace quantcore {
namespace analytics {

bool OrderBookStore::apply(const OrderBookSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = books_.find(snapshot.symbol);
    if (it != books_.end() && snapshot.timestamp <= it->second.timestamp) {
        ++discarded_;
        LOG_DEBUG("Stale order book for {} discarded ({} <= {})",
                  snapshot.symbol, snapshot.timestamp, it->second.timestamp);
        return false;
    }

    books_[snapshot.symbol] = snapshot;
    return true;
}

std::optional<OrderBookSnapshot> OrderBookStore::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> OrderBookStore::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(books_.size());
    for (const auto& kv : books_) {
        out.push_back(kv.first);
    }
    return out;
}

size_t OrderBookStore::discardedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

void OrderBookStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    books_.clear();
    discarded_ = 0;
}

} // namespace analytics
} // namespace quantcore

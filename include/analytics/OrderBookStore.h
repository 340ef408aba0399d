#pragma once

#include "analytics/OrderBook.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quantcore {
namespace analytics {

// Latest snapshot per symbol with last-write-wins on timestamp.
class OrderBookStore {
public:
    // Returns false and discards the snapshot when it is not newer than the held one.
    bool apply(const OrderBookSnapshot& snapshot);

    std::optional<OrderBookSnapshot> get(const std::string& symbol) const;
    std::vector<std::string> symbols() const;
    size_t discardedCount() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, OrderBookSnapshot> books_;
    size_t discarded_ = 0;
};

} // namespace analytics
} // namespace quantcore

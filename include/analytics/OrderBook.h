#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quantcore {
namespace analytics {

struct OrderBookLevel {
    double price;
    double quantity;
    std::optional<int> order_count;

    OrderBookLevel() : price(0.0), quantity(0.0) {}
    OrderBookLevel(double p, double q) : price(p), quantity(q) {}
    OrderBookLevel(double p, double q, int count) : price(p), quantity(q), order_count(count) {}

    double value() const { return price * quantity; }
};

// Level 2 snapshot. Bids are expected best (highest) first, asks best
// (lowest) first. All metrics are computed on access.
struct OrderBookSnapshot {
    std::string symbol;
    std::string exchange;
    Timestamp timestamp;
    std::vector<OrderBookLevel> bids;
    std::vector<OrderBookLevel> asks;

    OrderBookSnapshot() : timestamp(0) {}

    double bestBid() const { return bids.empty() ? 0.0 : bids.front().price; }
    double bestAsk() const { return asks.empty() ? 0.0 : asks.front().price; }
    double spread() const { return bestAsk() - bestBid(); }
    double midPrice() const { return (bestBid() + bestAsk()) / 2.0; }
    // spread / mid as a fraction; 0 when mid is not positive
    double spreadPercent() const;

    // (bestBid * askQty + bestAsk * bidQty) / (bidQty + askQty) on the top level
    double microprice() const;

    // Notional (price * qty) over the first `levels` levels
    double getBidDepth(int levels = 5) const;
    double getAskDepth(int levels = 5) const;
    double getTotalDepth(int levels = 5) const;

    double getBidVolume(int levels = 5) const;
    double getAskVolume(int levels = 5) const;

    // (bidQty - askQty) / (bidQty + askQty) over `levels`, in [-1, 1]; 0 on empty volume
    double getOrderBookImbalance(int levels = 5) const;
    // Falls back to midPrice() on empty volume
    double getWeightedMidPrice(int levels = 5) const;

    // Average fill price for sweeping `notional` from one side; 0 when the book is empty.
    double estimateFillPrice(double notional, OrderSide side, int levels = 20) const;
    // Fill price distance from mid as a fraction, positive is adverse
    double estimateSlippagePct(double notional, OrderSide side, int levels = 20) const;

    // Both sides non-empty, strictly ordered, not crossed
    bool isValid() const;

    // {symbol, exchange, timestamp, bids: [[price, qty(, count)] | {price, quantity, order_count}], asks: ...}
    static OrderBookSnapshot fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

} // namespace analytics
} // namespace quantcore

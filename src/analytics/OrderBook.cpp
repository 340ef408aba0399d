#include "analytics/OrderBook.h"
#include "common/Errors.h"
#include <algorithm>

namespace quantcore {
namespace analytics {

namespace {

size_t levelCount(const std::vector<OrderBookLevel>& side, int levels) {
    if (levels <= 0) return 0;
    return std::min(side.size(), static_cast<size_t>(levels));
}

double sumNotional(const std::vector<OrderBookLevel>& side, int levels) {
    double total = 0.0;
    for (size_t i = 0; i < levelCount(side, levels); ++i) total += side[i].value();
    return total;
}

double sumQuantity(const std::vector<OrderBookLevel>& side, int levels) {
    double total = 0.0;
    for (size_t i = 0; i < levelCount(side, levels); ++i) total += side[i].quantity;
    return total;
}

OrderBookLevel parseLevel(const nlohmann::json& level) {
    if (level.is_array()) {
        if (level.size() < 2) {
            throw InvalidParameterError("order book level needs price and quantity");
        }
        if (level.size() >= 3) {
            return OrderBookLevel(level[0].get<double>(), level[1].get<double>(), level[2].get<int>());
        }
        return OrderBookLevel(level[0].get<double>(), level[1].get<double>());
    }

    OrderBookLevel parsed(level.at("price").get<double>(), level.at("quantity").get<double>());
    if (level.contains("order_count") && !level["order_count"].is_null()) {
        parsed.order_count = level["order_count"].get<int>();
    }
    return parsed;
}

nlohmann::json levelToJson(const OrderBookLevel& level) {
    nlohmann::json j = {
        {"price", level.price},
        {"quantity", level.quantity}
    };
    if (level.order_count) {
        j["order_count"] = *level.order_count;
    }
    return j;
}

}

double OrderBookSnapshot::spreadPercent() const {
    double mid = midPrice();
    return mid > 0.0 ? spread() / mid : 0.0;
}

double OrderBookSnapshot::microprice() const {
    if (bids.empty() || asks.empty()) {
        return midPrice();
    }

    double bid_qty = bids.front().quantity;
    double ask_qty = asks.front().quantity;
    if (bid_qty + ask_qty <= 0.0) {
        return midPrice();
    }

    return (bestBid() * ask_qty + bestAsk() * bid_qty) / (bid_qty + ask_qty);
}

double OrderBookSnapshot::getBidDepth(int levels) const { return sumNotional(bids, levels); }
double OrderBookSnapshot::getAskDepth(int levels) const { return sumNotional(asks, levels); }
double OrderBookSnapshot::getTotalDepth(int levels) const { return getBidDepth(levels) + getAskDepth(levels); }

double OrderBookSnapshot::getBidVolume(int levels) const { return sumQuantity(bids, levels); }
double OrderBookSnapshot::getAskVolume(int levels) const { return sumQuantity(asks, levels); }

double OrderBookSnapshot::getOrderBookImbalance(int levels) const {
    double bid_volume = getBidVolume(levels);
    double ask_volume = getAskVolume(levels);
    double total = bid_volume + ask_volume;
    if (total <= 0.0) {
        return 0.0;
    }
    return (bid_volume - ask_volume) / total;
}

double OrderBookSnapshot::getWeightedMidPrice(int levels) const {
    double bid_volume = getBidVolume(levels);
    double ask_volume = getAskVolume(levels);
    if (bid_volume + ask_volume <= 0.0) {
        return midPrice();
    }

    double bid_price = bid_volume > 0.0 ? getBidDepth(levels) / bid_volume : bestBid();
    double ask_price = ask_volume > 0.0 ? getAskDepth(levels) / ask_volume : bestAsk();

    return (bid_price * ask_volume + ask_price * bid_volume) / (bid_volume + ask_volume);
}

double OrderBookSnapshot::estimateFillPrice(double notional, OrderSide side, int levels) const {
    if (notional <= 0.0) {
        return 0.0;
    }

    // Buying sweeps the asks, selling sweeps the bids
    const auto& book_side = (side == OrderSide::BUY) ? asks : bids;
    double remaining = notional;
    double total_qty = 0.0;
    double total_cost = 0.0;

    for (size_t i = 0; i < levelCount(book_side, levels) && remaining > 0.0; ++i) {
        double price = book_side[i].price;
        double size = book_side[i].quantity;
        if (price <= 0.0 || size <= 0.0) {
            continue;
        }

        double take_notional = std::min(remaining, price * size);
        double take_qty = take_notional / price;

        total_qty += take_qty;
        total_cost += take_qty * price;
        remaining -= take_notional;
    }

    if (total_qty <= 0.0) {
        return 0.0;
    }
    return total_cost / total_qty;
}

double OrderBookSnapshot::estimateSlippagePct(double notional, OrderSide side, int levels) const {
    double mid = midPrice();
    if (mid <= 0.0) {
        return 0.0;
    }

    double fill = estimateFillPrice(notional, side, levels);
    if (fill <= 0.0) {
        return 0.0;
    }

    return side == OrderSide::BUY ? (fill - mid) / mid : (mid - fill) / mid;
}

bool OrderBookSnapshot::isValid() const {
    if (bids.empty() || asks.empty()) {
        return false;
    }

    if (bestBid() >= bestAsk()) {
        return false;
    }

    for (size_t i = 1; i < bids.size(); ++i) {
        if (bids[i].price >= bids[i - 1].price) return false;
    }

    for (size_t i = 1; i < asks.size(); ++i) {
        if (asks[i].price <= asks[i - 1].price) return false;
    }

    return true;
}

OrderBookSnapshot OrderBookSnapshot::fromJson(const nlohmann::json& j) {
    OrderBookSnapshot snapshot;
    snapshot.symbol = j.value("symbol", std::string());
    snapshot.exchange = j.value("exchange", std::string());
    snapshot.timestamp = j.value("timestamp", 0LL);

    if (j.contains("bids")) {
        for (const auto& level : j["bids"]) snapshot.bids.push_back(parseLevel(level));
    }
    if (j.contains("asks")) {
        for (const auto& level : j["asks"]) snapshot.asks.push_back(parseLevel(level));
    }
    return snapshot;
}

nlohmann::json OrderBookSnapshot::toJson() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["exchange"] = exchange;
    j["timestamp"] = timestamp;

    j["bids"] = nlohmann::json::array();
    for (const auto& level : bids) j["bids"].push_back(levelToJson(level));
    j["asks"] = nlohmann::json::array();
    for (const auto& level : asks) j["asks"].push_back(levelToJson(level));

    j["best_bid"] = bestBid();
    j["best_ask"] = bestAsk();
    j["spread"] = spread();
    j["spread_percent"] = spreadPercent();
    j["mid_price"] = midPrice();
    j["microprice"] = microprice();
    j["total_depth"] = getTotalDepth();
    j["order_book_imbalance"] = getOrderBookImbalance();
    return j;
}

} // namespace analytics
} // namespace quantcore

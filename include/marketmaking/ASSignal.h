#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace quantcore {
namespace marketmaking {

// Two-sided quote produced by the Avellaneda-Stoikov engine.
struct ASSignal {
    std::string symbol;
    Timestamp timestamp;

    double bid_price;
    double ask_price;
    double bid_quantity;
    double ask_quantity;

    std::optional<double> reservation_price;
    std::optional<double> optimal_spread;
    std::optional<double> current_inventory;

    double confidence;          // 0.0 ~ 1.0
    bool is_valid;
    std::optional<std::string> invalid_reason;

    ASSignal()
        : timestamp(0)
        , bid_price(0.0)
        , ask_price(0.0)
        , bid_quantity(0.0)
        , ask_quantity(0.0)
        , confidence(1.0)
        , is_valid(true)
    {}

    double spread() const { return ask_price - bid_price; }
    double midPrice() const { return (bid_price + ask_price) / 2.0; }
    double spreadPercent() const {
        double mid = midPrice();
        return mid > 0.0 ? spread() / mid : 0.0;
    }
    double spreadBps() const { return spreadPercent() * 10000.0; }
    double totalNotional() const { return bid_quantity * bid_price + ask_quantity * ask_price; }

    // Flagged valid, positive prices and sizes, not crossed, spread within bounds
    bool validateForExecution(double min_spread_bps = 1.0, double max_spread_bps = 1000.0) const;

    // Zeroed prices/sizes, confidence 0
    static ASSignal createInvalid(const std::string& symbol, const std::string& reason,
                                  Timestamp timestamp = 0);

    nlohmann::json toJson() const;
    std::string toString() const;
};

} // namespace marketmaking
} // namespace quantcore

#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <vector>

namespace quantcore {
namespace marketmaking {

// Fixed 22-value observation vector consumed by downstream learners.
// Field order is a contract: changing it requires bumping FEATURE_VERSION.
struct ASFeatures {
    static constexpr size_t FEATURE_COUNT = 22;
    static constexpr int FEATURE_VERSION = 1;

    // Inventory (4)
    double current_inventory = 0.0;
    double inventory_pct = 0.0;                     // |inventory| / max, 0.0 ~ 1.0
    double inventory_distance_from_target = 0.0;
    double inventory_change_rate = 0.0;

    // Order book (9)
    double best_bid = 0.0;
    double best_ask = 0.0;
    double bid_volume = 0.0;                        // top level
    double ask_volume = 0.0;                        // top level
    double spread = 0.0;
    double spread_pct = 0.0;
    double order_book_imbalance = 0.0;              // -1 ~ +1
    double microprice = 0.0;
    double weighted_mid_price = 0.0;

    // Microstructure (4)
    double recent_trade_direction = 0.0;            // positive = buying pressure
    double trade_flow_imbalance = 0.0;
    double quote_update_frequency = 0.0;            // updates per second
    double time_since_last_trade = 0.0;             // seconds

    // Volatility / candles (5)
    double volatility_1min = 0.0;
    double momentum_1min = 0.0;
    double volume_1min = 0.0;
    double vwap_distance = 0.0;
    double high_low_range_1min = 0.0;

    std::array<double, FEATURE_COUNT> toArray() const;
    // Throws InvalidParameterError unless exactly FEATURE_COUNT values are given
    static ASFeatures fromArray(const std::vector<double>& values);

    static const std::array<std::string, FEATURE_COUNT>& featureNames();
    // group -> names, in vector order
    static std::vector<std::pair<std::string, std::vector<std::string>>> featureGroups();

    nlohmann::json toJson() const;
};

} // namespace marketmaking
} // namespace quantcore

#include "marketmaking/ASFeatures.h"
#include "common/Errors.h"

namespace quantcore {
namespace marketmaking {

constexpr size_t ASFeatures::FEATURE_COUNT;
constexpr int ASFeatures::FEATURE_VERSION;

std::array<double, ASFeatures::FEATURE_COUNT> ASFeatures::toArray() const {
    return {{
        current_inventory,
        inventory_pct,
        inventory_distance_from_target,
        inventory_change_rate,

        best_bid,
        best_ask,
        bid_volume,
        ask_volume,
        spread,
        spread_pct,
        order_book_imbalance,
        microprice,
        weighted_mid_price,

        recent_trade_direction,
        trade_flow_imbalance,
        quote_update_frequency,
        time_since_last_trade,

        volatility_1min,
        momentum_1min,
        volume_1min,
        vwap_distance,
        high_low_range_1min
    }};
}

ASFeatures ASFeatures::fromArray(const std::vector<double>& values) {
    if (values.size() != FEATURE_COUNT) {
        throw InvalidParameterError("Expected " + std::to_string(FEATURE_COUNT) +
                                    " features, got " + std::to_string(values.size()));
    }

    ASFeatures f;
    f.current_inventory = values[0];
    f.inventory_pct = values[1];
    f.inventory_distance_from_target = values[2];
    f.inventory_change_rate = values[3];
    f.best_bid = values[4];
    f.best_ask = values[5];
    f.bid_volume = values[6];
    f.ask_volume = values[7];
    f.spread = values[8];
    f.spread_pct = values[9];
    f.order_book_imbalance = values[10];
    f.microprice = values[11];
    f.weighted_mid_price = values[12];
    f.recent_trade_direction = values[13];
    f.trade_flow_imbalance = values[14];
    f.quote_update_frequency = values[15];
    f.time_since_last_trade = values[16];
    f.volatility_1min = values[17];
    f.momentum_1min = values[18];
    f.volume_1min = values[19];
    f.vwap_distance = values[20];
    f.high_low_range_1min = values[21];
    return f;
}

const std::array<std::string, ASFeatures::FEATURE_COUNT>& ASFeatures::featureNames() {
    static const std::array<std::string, FEATURE_COUNT> names = {{
        "current_inventory", "inventory_pct", "inventory_distance_from_target", "inventory_change_rate",
        "best_bid", "best_ask", "bid_volume", "ask_volume", "spread", "spread_pct",
        "order_book_imbalance", "microprice", "weighted_mid_price",
        "recent_trade_direction", "trade_flow_imbalance", "quote_update_frequency", "time_since_last_trade",
        "volatility_1min", "momentum_1min", "volume_1min", "vwap_distance", "high_low_range_1min"
    }};
    return names;
}

std::vector<std::pair<std::string, std::vector<std::string>>> ASFeatures::featureGroups() {
    const auto& names = featureNames();
    auto slice = [&names](size_t from, size_t to) {
        return std::vector<std::string>(names.begin() + from, names.begin() + to);
    };
    return {
        {"inventory", slice(0, 4)},
        {"order_book", slice(4, 13)},
        {"microstructure", slice(13, 17)},
        {"volatility_candles", slice(17, 22)}
    };
}

nlohmann::json ASFeatures::toJson() const {
    nlohmann::json j;
    j["feature_version"] = FEATURE_VERSION;

    const auto values = toArray();
    const auto& names = featureNames();
    nlohmann::json features = nlohmann::json::object();
    for (size_t i = 0; i < FEATURE_COUNT; ++i) {
        features[names[i]] = values[i];
    }
    j["features"] = features;
    return j;
}

} // namespace marketmaking
} // namespace quantcore

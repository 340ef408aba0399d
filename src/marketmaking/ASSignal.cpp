#include "marketmaking/ASSignal.h"
#include <iomanip>
#include <sstream>

namespace quantcore {
namespace marketmaking {

bool ASSignal::validateForExecution(double min_spread_bps, double max_spread_bps) const {
    if (!is_valid) {
        return false;
    }

    if (bid_price <= 0.0 || ask_price <= 0.0) {
        return false;
    }

    if (bid_quantity <= 0.0 || ask_quantity <= 0.0) {
        return false;
    }

    // Crossed or locked quote
    if (bid_price >= ask_price) {
        return false;
    }

    double bps = spreadBps();
    return bps >= min_spread_bps && bps <= max_spread_bps;
}

ASSignal ASSignal::createInvalid(const std::string& symbol, const std::string& reason,
                                 Timestamp timestamp) {
    ASSignal signal;
    signal.symbol = symbol;
    signal.timestamp = timestamp != 0 ? timestamp : nowMillis();
    signal.confidence = 0.0;
    signal.is_valid = false;
    signal.invalid_reason = reason;
    return signal;
}

nlohmann::json ASSignal::toJson() const {
    nlohmann::json j = {
        {"symbol", symbol},
        {"timestamp", timestamp},
        {"bid_price", bid_price},
        {"ask_price", ask_price},
        {"bid_quantity", bid_quantity},
        {"ask_quantity", ask_quantity},
        {"confidence", confidence},
        {"is_valid", is_valid},
        {"spread", spread()},
        {"spread_bps", spreadBps()},
        {"mid_price", midPrice()},
        {"total_notional", totalNotional()}
    };

    j["reservation_price"] = reservation_price ? nlohmann::json(*reservation_price) : nlohmann::json();
    j["optimal_spread"] = optimal_spread ? nlohmann::json(*optimal_spread) : nlohmann::json();
    j["current_inventory"] = current_inventory ? nlohmann::json(*current_inventory) : nlohmann::json();
    j["invalid_reason"] = invalid_reason ? nlohmann::json(*invalid_reason) : nlohmann::json();
    return j;
}

std::string ASSignal::toString() const {
    std::ostringstream ss;
    if (!is_valid) {
        ss << symbol << " INVALID: " << invalid_reason.value_or("unknown");
        return ss.str();
    }

    ss << std::fixed << std::setprecision(8)
       << symbol << " | Bid: " << bid_price << " x " << std::setprecision(4) << bid_quantity
       << std::setprecision(8) << " | Ask: " << ask_price << " x " << std::setprecision(4) << ask_quantity
       << std::setprecision(2) << " | Spread: " << spreadBps() << " bps"
       << " | Conf: " << confidence;
    return ss.str();
}

} // namespace marketmaking
} // namespace quantcore

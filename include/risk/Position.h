#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace quantcore {
namespace risk {

// Open position. BUY means long, SELL means short.
// Unrealized PnL is derived on every call. realized_pnl and exited_quantity
// accumulate partial exits until the position closes.
struct Position {
    std::string id;
    std::string symbol;
    std::string exchange;
    OrderSide side;
    double quantity;
    double entry_price;
    double current_price;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    Timestamp opened_at;
    Timestamp updated_at;
    std::optional<std::string> strategy_id;
    std::optional<std::string> open_order_id;
    double realized_pnl;
    double exited_quantity;

    Position()
        : side(OrderSide::BUY)
        , quantity(0.0)
        , entry_price(0.0)
        , current_price(0.0)
        , opened_at(0)
        , updated_at(0)
        , realized_pnl(0.0)
        , exited_quantity(0.0)
    {}

    bool isLong() const { return side == OrderSide::BUY; }

    double entryValue() const { return quantity * entry_price; }
    double currentValue() const { return quantity * current_price; }

    double unrealizedPnL() const {
        return isLong() ? (current_price - entry_price) * quantity
                        : (entry_price - current_price) * quantity;
    }

    // Percent of entry value; 0 when entry price is 0
    double unrealizedPnLPercent() const {
        double value = entryValue();
        if (entry_price == 0.0 || value == 0.0) return 0.0;
        return unrealizedPnL() / value * 100.0;
    }

    bool isStopLossHit() const {
        if (!stop_loss) return false;
        return isLong() ? current_price <= *stop_loss : current_price >= *stop_loss;
    }

    bool isTakeProfitHit() const {
        if (!take_profit) return false;
        return isLong() ? current_price >= *take_profit : current_price <= *take_profit;
    }
};

} // namespace risk
} // namespace quantcore

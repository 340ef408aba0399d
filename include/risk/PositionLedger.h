#pragma once

#include "risk/Position.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quantcore {
namespace risk {

// Execution report from the external order layer
struct Fill {
    std::string symbol;
    std::string exchange;
    OrderSide side;
    double quantity;
    double price;
    Timestamp timestamp;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<std::string> strategy_id;
    std::optional<std::string> order_id;

    Fill() : side(OrderSide::BUY), quantity(0.0), price(0.0), timestamp(0) {}
};

// Totals cover the whole lifetime: quantity is everything exited and
// realized_pnl includes earlier partial exits.
struct ClosedPosition {
    Position position;          // as it was at close
    double exit_price;
    double realized_pnl;
    Timestamp closed_at;

    ClosedPosition() : exit_price(0.0), realized_pnl(0.0), closed_at(0) {}
};

// Thread-safe book of open positions, one per symbol.
// Opened on a fill, updated by price ticks and partial exits, closed when
// quantity reaches zero or on an explicit close.
class PositionLedger {
public:
    // Same-side fills average into the open position. Throws
    // InvalidParameterError for non-positive size/price or an opposite-side
    // fill on an open position.
    Position openPosition(const Fill& fill);

    // Returns false when the symbol has no open position
    bool updatePrice(const std::string& symbol, double price, Timestamp ts);

    // Reduces quantity at `price`. Reaching zero closes the position.
    // Throws InvalidParameterError when `quantity` exceeds the open size.
    std::optional<ClosedPosition> applyPartialFill(const std::string& symbol, double quantity,
                                                   double price, Timestamp ts);

    std::optional<ClosedPosition> closePosition(const std::string& symbol, double exit_price, Timestamp ts);

    std::optional<Position> getPosition(const std::string& symbol) const;
    std::vector<Position> getOpenPositions() const;
    std::vector<ClosedPosition> getClosedPositions() const;
    bool hasPosition(const std::string& symbol) const;

    double totalUnrealizedPnL() const;
    double totalRealizedPnL() const;

    // Open positions whose stop-loss or take-profit level has been reached
    std::vector<Position> positionsHittingStops() const;

private:
    ClosedPosition closeLocked(std::map<std::string, Position>::iterator it, double exit_price, Timestamp ts);

    mutable std::mutex mutex_;
    std::map<std::string, Position> positions_;
    std::vector<ClosedPosition> closed_;
    double realized_pnl_ = 0.0;
    long long position_seq_ = 0;
};

} // namespace risk
} // namespace quantcore

#include "risk/PositionLedger.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>

namespace quantcore {
namespace risk {

namespace {
constexpr double kQuantityTolerance = 1e-9;
}

Position PositionLedger::openPosition(const Fill& fill) {
    std::vector<std::string> errors;
    if (fill.symbol.empty()) errors.push_back("symbol must not be empty");
    if (!(fill.quantity > 0.0)) errors.push_back("quantity must be positive");
    if (!(fill.price > 0.0)) errors.push_back("price must be positive");
    if (!errors.empty()) {
        throw InvalidParameterError(std::move(errors));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = positions_.find(fill.symbol);
    if (it != positions_.end()) {
        Position& pos = it->second;
        if (pos.side != fill.side) {
            throw InvalidParameterError("opposite-side fill on open " + std::string(toString(pos.side)) +
                                        " position for " + fill.symbol + "; use applyPartialFill");
        }

        double total_qty = pos.quantity + fill.quantity;
        pos.entry_price = (pos.entry_price * pos.quantity + fill.price * fill.quantity) / total_qty;
        pos.quantity = total_qty;
        pos.current_price = fill.price;
        pos.updated_at = fill.timestamp;
        if (fill.stop_loss) pos.stop_loss = fill.stop_loss;
        if (fill.take_profit) pos.take_profit = fill.take_profit;
        if (fill.order_id) pos.open_order_id = fill.order_id;

        LOG_INFO("Position increased: {} {} qty {:.8f} avg {:.8f}",
                 pos.symbol, toString(pos.side), pos.quantity, pos.entry_price);
        return pos;
    }

    Position pos;
    pos.id = "pos-" + std::to_string(++position_seq_);
    pos.symbol = fill.symbol;
    pos.exchange = fill.exchange;
    pos.side = fill.side;
    pos.quantity = fill.quantity;
    pos.entry_price = fill.price;
    pos.current_price = fill.price;
    pos.stop_loss = fill.stop_loss;
    pos.take_profit = fill.take_profit;
    pos.opened_at = fill.timestamp;
    pos.updated_at = fill.timestamp;
    pos.strategy_id = fill.strategy_id;
    pos.open_order_id = fill.order_id;

    positions_[fill.symbol] = pos;
    LOG_INFO("Position opened: {} {} qty {:.8f} @ {:.8f} ({})",
             pos.symbol, toString(pos.side), pos.quantity, pos.entry_price, pos.id);
    return pos;
}

bool PositionLedger::updatePrice(const std::string& symbol, double price, Timestamp ts) {
    if (!(price > 0.0)) {
        throw InvalidParameterError("price must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return false;
    }

    it->second.current_price = price;
    it->second.updated_at = ts;
    return true;
}

std::optional<ClosedPosition> PositionLedger::applyPartialFill(
    const std::string& symbol, double quantity, double price, Timestamp ts
) {
    if (!(quantity > 0.0) || !(price > 0.0)) {
        throw InvalidParameterError("partial fill needs positive quantity and price");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        throw InvalidParameterError("no open position for " + symbol);
    }

    Position& pos = it->second;
    if (quantity > pos.quantity * (1.0 + kQuantityTolerance)) {
        throw InvalidParameterError("partial fill " + std::to_string(quantity) + " exceeds open quantity " +
                                    std::to_string(pos.quantity) + " for " + symbol);
    }
    double exit_qty = std::min(quantity, pos.quantity);

    // Realize PnL on the exited slice
    Position slice = pos;
    slice.quantity = exit_qty;
    slice.current_price = price;
    double slice_pnl = slice.unrealizedPnL();
    realized_pnl_ += slice_pnl;

    pos.quantity -= exit_qty;
    pos.realized_pnl += slice_pnl;
    pos.exited_quantity += exit_qty;
    pos.current_price = price;
    pos.updated_at = ts;

    if (pos.quantity <= 0.0) {
        ClosedPosition closed;
        closed.position = pos;
        closed.position.quantity = pos.exited_quantity;
        closed.exit_price = price;
        closed.realized_pnl = pos.realized_pnl;
        closed.closed_at = ts;
        closed_.push_back(closed);
        positions_.erase(it);

        LOG_INFO("Position closed by fill: {} @ {:.8f}, PnL {:.4f}", symbol, price, closed.realized_pnl);
        return closed;
    }

    LOG_INFO("Partial exit: {} qty {:.8f} @ {:.8f}, remaining {:.8f}",
             symbol, exit_qty, price, pos.quantity);
    return std::nullopt;
}

std::optional<ClosedPosition> PositionLedger::closePosition(const std::string& symbol,
                                                            double exit_price, Timestamp ts) {
    if (!(exit_price > 0.0)) {
        throw InvalidParameterError("exit price must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return closeLocked(it, exit_price, ts);
}

ClosedPosition PositionLedger::closeLocked(std::map<std::string, Position>::iterator it,
                                           double exit_price, Timestamp ts) {
    ClosedPosition closed;
    closed.position = it->second;
    closed.position.current_price = exit_price;
    closed.position.updated_at = ts;
    closed.exit_price = exit_price;
    double final_pnl = closed.position.unrealizedPnL();
    closed.position.realized_pnl += final_pnl;
    closed.position.exited_quantity += closed.position.quantity;
    closed.position.quantity = closed.position.exited_quantity;
    closed.realized_pnl = closed.position.realized_pnl;
    closed.closed_at = ts;

    realized_pnl_ += final_pnl;
    closed_.push_back(closed);
    positions_.erase(it);

    LOG_INFO("Position closed: {} @ {:.8f}, PnL {:.4f}",
             closed.position.symbol, exit_price, closed.realized_pnl);
    return closed;
}

std::optional<Position> PositionLedger::getPosition(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Position> PositionLedger::getOpenPositions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& kv : positions_) {
        out.push_back(kv.second);
    }
    return out;
}

std::vector<ClosedPosition> PositionLedger::getClosedPositions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool PositionLedger::hasPosition(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(symbol) > 0;
}

double PositionLedger::totalUnrealizedPnL() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& kv : positions_) {
        total += kv.second.unrealizedPnL();
    }
    return total;
}

double PositionLedger::totalRealizedPnL() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_pnl_;
}

std::vector<Position> PositionLedger::positionsHittingStops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    for (const auto& kv : positions_) {
        if (kv.second.isStopLossHit() || kv.second.isTakeProfitHit()) {
            out.push_back(kv.second);
        }
    }
    return out;
}

} // namespace risk
} // namespace quantcore

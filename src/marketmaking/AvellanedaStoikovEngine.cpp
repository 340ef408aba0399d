#include "marketmaking/AvellanedaStoikovEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace quantcore {
namespace marketmaking {

namespace {

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) out += "; ";
        out += errors[i];
    }
    return out;
}

constexpr double kBaseSizeFraction = 0.1;

}

AvellanedaStoikovEngine::AvellanedaStoikovEngine(int order_book_levels)
    : order_book_levels_(std::max(order_book_levels, 1))
{
}

double AvellanedaStoikovEngine::reservationPrice(double mid, double inventory, const ASParameters& params) {
    const double q = inventory - params.target_inventory;
    return mid * (1.0 - q * params.gamma * params.sigma * params.sigma * params.T);
}

double AvellanedaStoikovEngine::optimalSpread(double mid, const ASParameters& params) {
    const double risk_term = params.gamma * params.sigma * params.sigma * params.T;
    const double liquidity_term = (2.0 / params.gamma) * std::log(1.0 + params.gamma / params.kappa);
    return mid * (risk_term + liquidity_term);
}

double AvellanedaStoikovEngine::clampSpread(double spread, double mid, const ASParameters& params) {
    const double min_spread = mid * params.min_spread_bps / 10000.0;
    const double max_spread = mid * params.max_spread_bps / 10000.0;
    return std::clamp(spread, min_spread, max_spread);
}

AvellanedaStoikovEngine::Sizes AvellanedaStoikovEngine::quoteSizes(double inventory, const ASParameters& params) {
    const double base = params.max_inventory * kBaseSizeFraction;
    const double q = inventory - params.target_inventory;
    const double away_scale = std::max(0.0, 1.0 - std::abs(q) / params.max_inventory);

    // Full size on the side whose fill moves inventory toward target
    double bid_scale = (q > 0.0) ? away_scale : 1.0;
    double ask_scale = (q < 0.0) ? away_scale : 1.0;

    // Position limit room on each side
    double bid_capacity = std::max(0.0, params.max_inventory - inventory);
    double ask_capacity = std::max(0.0, params.max_inventory + inventory);

    Sizes sizes;
    sizes.bid = std::min(base * bid_scale, bid_capacity);
    sizes.ask = std::min(base * ask_scale, ask_capacity);
    return sizes;
}

double AvellanedaStoikovEngine::confidenceFor(double inventory, const ASParameters& params) {
    return std::clamp(1.0 - 0.5 * std::abs(inventory) / params.max_inventory, 0.0, 1.0);
}

ASSignal AvellanedaStoikovEngine::computeQuote(
    const analytics::OrderBookSnapshot& book,
    const ASParameters& params,
    double inventory
) const {
    const Timestamp ts = book.timestamp != 0 ? book.timestamp : nowMillis();

    if (!book.isValid()) {
        LOG_WARN("{} - invalid order book, quote withheld", book.symbol);
        return ASSignal::createInvalid(book.symbol, "Invalid order book: empty, unsorted or crossed", ts);
    }

    auto errors = params.validate();
    if (!errors.empty()) {
        LOG_WARN("{} - invalid AS parameters: {}", book.symbol, joinErrors(errors));
        return ASSignal::createInvalid(book.symbol, "Invalid parameters: " + joinErrors(errors), ts);
    }

    if (!std::isfinite(inventory)) {
        return ASSignal::createInvalid(book.symbol, "Inventory is not finite", ts);
    }

    const double mid = book.midPrice();
    if (mid <= 0.0) {
        return ASSignal::createInvalid(book.symbol, "Mid price is not positive", ts);
    }

    const double reservation = reservationPrice(mid, inventory, params);
    const double raw_spread = optimalSpread(mid, params);
    const double spread = clampSpread(raw_spread, mid, params);

    const double bid = reservation - spread / 2.0;
    const double ask = reservation + spread / 2.0;
    if (!std::isfinite(bid) || !std::isfinite(ask) || bid <= 0.0 || ask <= 0.0) {
        LOG_WARN("{} - quote prices not positive (bid {:.8f}, ask {:.8f})", book.symbol, bid, ask);
        return ASSignal::createInvalid(book.symbol, "Quote prices are not positive", ts);
    }

    const Sizes sizes = quoteSizes(inventory, params);
    if (sizes.bid <= 0.0 && sizes.ask <= 0.0) {
        return ASSignal::createInvalid(book.symbol, "No inventory capacity on either side", ts);
    }

    ASSignal signal;
    signal.symbol = book.symbol;
    signal.timestamp = ts;
    signal.bid_price = bid;
    signal.ask_price = ask;
    signal.bid_quantity = sizes.bid;
    signal.ask_quantity = sizes.ask;
    signal.reservation_price = reservation;
    signal.optimal_spread = spread;
    signal.current_inventory = inventory;
    signal.confidence = confidenceFor(inventory, params);

    LOG_DEBUG("{} - AS quote: r={:.8f} spread={:.8f} (raw {:.8f}) inv={:.4f}",
              book.symbol, reservation, spread, raw_spread, inventory);
    return signal;
}

ASFeatures AvellanedaStoikovEngine::extractFeatures(
    const analytics::OrderBookSnapshot& book,
    const ASParameters& params,
    double inventory,
    const MarketContext& context
) const {
    ASFeatures f;

    // Inventory
    f.current_inventory = inventory;
    f.inventory_pct = params.max_inventory > 0.0 ? std::abs(inventory) / params.max_inventory : 0.0;
    f.inventory_distance_from_target = inventory - params.target_inventory;
    f.inventory_change_rate = context.inventory_change_rate;

    // Order book
    f.best_bid = book.bestBid();
    f.best_ask = book.bestAsk();
    f.bid_volume = book.bids.empty() ? 0.0 : book.bids.front().quantity;
    f.ask_volume = book.asks.empty() ? 0.0 : book.asks.front().quantity;
    f.spread = book.spread();
    f.spread_pct = book.spreadPercent();
    f.order_book_imbalance = book.getOrderBookImbalance(order_book_levels_);
    f.microprice = book.microprice();
    f.weighted_mid_price = book.getWeightedMidPrice(order_book_levels_);

    // Microstructure
    if (!context.recent_trades.empty()) {
        double buy_count = 0.0, sell_count = 0.0;
        double buy_volume = 0.0, sell_volume = 0.0;
        for (const auto& trade : context.recent_trades) {
            if (trade.aggressor == OrderSide::BUY) {
                buy_count += 1.0;
                buy_volume += trade.quantity;
            } else {
                sell_count += 1.0;
                sell_volume += trade.quantity;
            }
        }

        f.recent_trade_direction = (buy_count - sell_count) / (buy_count + sell_count);
        double total_volume = buy_volume + sell_volume;
        f.trade_flow_imbalance = total_volume > 0.0 ? (buy_volume - sell_volume) / total_volume : 0.0;

        const Timestamp now = context.now != 0 ? context.now : book.timestamp;
        const Timestamp last = context.recent_trades.back().timestamp;
        f.time_since_last_trade = now > last ? static_cast<double>(now - last) / 1000.0 : 0.0;
    }
    if (context.window_seconds > 0.0) {
        f.quote_update_frequency = context.quote_updates / context.window_seconds;
    }

    // Volatility / candles
    const auto& candles = context.recent_candles;
    if (!candles.empty()) {
        const Candle& last = candles.back();
        f.momentum_1min = last.open > 0.0 ? (last.close - last.open) / last.open : 0.0;
        f.volume_1min = last.volume;
        f.high_low_range_1min = last.close > 0.0 ? (last.high - last.low) / last.close : 0.0;
    }
    if (candles.size() >= 2) {
        const int period = static_cast<int>(candles.size()) - 1;
        auto closes = analytics::TechnicalIndicators::extractClosePrices(candles);
        bool positive = std::all_of(closes.begin(), closes.end(), [](double c) { return c > 0.0; });
        if (positive) {
            f.volatility_1min = analytics::TechnicalIndicators::calculateVolatility(closes, period);
        }

        double vwap = analytics::TechnicalIndicators::calculateVWAP(candles, period);
        double mid = book.midPrice();
        if (vwap > 0.0 && mid > 0.0) {
            f.vwap_distance = (mid - vwap) / vwap;
        }
    }

    return f;
}

} // namespace marketmaking
} // namespace quantcore

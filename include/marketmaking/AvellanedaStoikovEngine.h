#pragma once

#include "analytics/OrderBook.h"
#include "marketmaking/ASFeatures.h"
#include "marketmaking/ASParameters.h"
#include "marketmaking/ASSignal.h"
#include <vector>

namespace quantcore {
namespace marketmaking {

struct TradeTick {
    Timestamp timestamp;
    double price;
    double quantity;
    OrderSide aggressor;        // side that crossed the spread

    TradeTick() : timestamp(0), price(0.0), quantity(0.0), aggressor(OrderSide::BUY) {}
    TradeTick(Timestamp ts, double p, double q, OrderSide side)
        : timestamp(ts), price(p), quantity(q), aggressor(side) {}
};

// Optional inputs for the microstructure and volatility feature groups.
// Anything left empty produces zeros.
struct MarketContext {
    std::vector<TradeTick> recent_trades;       // oldest first
    int quote_updates;
    double window_seconds;
    std::vector<Candle> recent_candles;         // 1-minute bars, oldest first
    double inventory_change_rate;
    Timestamp now;                              // 0 -> snapshot timestamp

    MarketContext() : quote_updates(0), window_seconds(0.0), inventory_change_rate(0.0), now(0) {}
};

// Avellaneda-Stoikov quoting.
//
//   q       = inventory - target
//   r       = mid * (1 - q * gamma * sigma^2 * T)
//   delta   = gamma * sigma^2 * T + (2 / gamma) * ln(1 + gamma / kappa)
//   spread  = clamp(mid * delta, min_bps, max_bps)
//   bid/ask = r -/+ spread / 2
//
// sigma is a fraction of price and T runs from 1.0 to 0.0 over the session,
// so price terms are scaled by mid.
//
// Quotes are not clipped to the current book. The skew in r is unbounded
// while the spread is capped at max_bps, so with enough inventory one side
// lands through the touch (conservative preset, q = 0.5: ask 99.0 against a
// 99.99 best bid). Callers that need passive orders must check the book.
//
// Sizes: base = 0.1 * max_inventory. The side that moves inventory away from
// target is scaled by max(0, 1 - |q| / max_inventory). Each side is then
// capped by its own room to the limit, bid <= max - inventory and
// ask <= max + inventory, so the reducing side may exceed max - |inventory|.
class AvellanedaStoikovEngine {
public:
    explicit AvellanedaStoikovEngine(int order_book_levels = 5);

    // Never throws; bad books or parameters produce ASSignal::createInvalid
    ASSignal computeQuote(const analytics::OrderBookSnapshot& book,
                          const ASParameters& params,
                          double inventory) const;

    ASFeatures extractFeatures(const analytics::OrderBookSnapshot& book,
                               const ASParameters& params,
                               double inventory,
                               const MarketContext& context = MarketContext()) const;

    static double reservationPrice(double mid, double inventory, const ASParameters& params);
    // Unclamped optimal spread in price units
    static double optimalSpread(double mid, const ASParameters& params);
    static double clampSpread(double spread, double mid, const ASParameters& params);

    struct Sizes {
        double bid;
        double ask;
    };
    static Sizes quoteSizes(double inventory, const ASParameters& params);

    static double confidenceFor(double inventory, const ASParameters& params);

private:
    int order_book_levels_;
};

} // namespace marketmaking
} // namespace quantcore

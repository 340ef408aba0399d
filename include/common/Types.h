#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace quantcore {

using Timestamp = long long;    // milliseconds since epoch
using Price = double;
using Volume = double;

enum class OrderSide { BUY, SELL };

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline Timestamp nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// One OHLCV bar. Produced by ingestion, never mutated afterwards.
struct Candle {
    std::string symbol;
    double open;
    double high;
    double low;
    double close;
    double volume;
    Timestamp timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, Timestamp t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    Candle(std::string sym, double o, double h, double l, double c, double v, Timestamp t)
        : symbol(std::move(sym)), open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    // high >= max(open, close), low <= min(open, close), volume >= 0
    bool isWellFormed() const {
        return high >= open && high >= close &&
               low <= open && low <= close &&
               volume >= 0.0;
    }

    double typicalPrice() const { return (high + low + close) / 3.0; }

    // Percent change of the bar body, e.g. 3.0 for +3%.
    double changePercent() const {
        if (open == 0.0) return 0.0;
        return (close - open) / open * 100.0;
    }
};

using MarketData = Candle;

// Strictly increasing timestamps and well-formed bars.
inline bool validateSeries(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        if (!candles[i].isWellFormed()) return false;
        if (i > 0 && candles[i].timestamp <= candles[i - 1].timestamp) return false;
    }
    return true;
}

} // namespace quantcore

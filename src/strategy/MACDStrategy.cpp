#include "strategy/MACDStrategy.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace quantcore {
namespace strategy {

MACDStrategy::MACDStrategy(const MACDStrategyConfig& config,
                           std::shared_ptr<analytics::IndicatorService> indicators)
    : config_(config)
    , indicators_(std::move(indicators))
{
    LOG_INFO("MACD strategy initialized ({}/{}/{})",
             config_.fast_period, config_.slow_period, config_.signal_period);
}

StrategyInfo MACDStrategy::getInfo() const {
    return StrategyInfo("macd", "MACD", "MACD histogram crossover with volume confirmation");
}

Signal MACDStrategy::evaluate(const MarketData& current, const std::vector<MarketData>& bars) {
    auto macd = indicators_->calculateMACD(current.symbol, bars,
                                           config_.fast_period, config_.slow_period, config_.signal_period);
    const double price = current.close;

    // Histogram magnitude relative to 1% of price, kept within [0.5, 0.95]
    auto strength = [&]() {
        if (price <= 0.0) return 0.5;
        return std::clamp(std::abs(macd.histogram) / (price * 0.01), 0.5, 0.95);
    };

    Signal signal;
    if (macd.histogram > config_.buy_threshold) {
        signal = makeSignal(current, SignalAction::BUY, strength(),
                            "MACD: " + fixed(macd.macd, 4) + " > Signal: " + fixed(macd.signal, 4) +
                            ", Histogram: " + fixed(macd.histogram, 4) + " (BULLISH CROSSOVER)");
        setExits(signal, 0.97, 1.06);
    } else if (macd.histogram < config_.sell_threshold) {
        signal = makeSignal(current, SignalAction::SELL, strength(),
                            "MACD: " + fixed(macd.macd, 4) + " < Signal: " + fixed(macd.signal, 4) +
                            ", Histogram: " + fixed(macd.histogram, 4) + " (BEARISH CROSSOVER)");
        setExits(signal, 1.03, 0.94);
    } else {
        signal = makeSignal(current, SignalAction::HOLD, 0.4,
                            "MACD: " + fixed(macd.macd, 4) + ", Signal: " + fixed(macd.signal, 4) +
                            ", Histogram: " + fixed(macd.histogram, 4) + " (NEUTRAL)");
    }

    if (current.volume < config_.min_volume_threshold) {
        signal.confidence *= 0.7;
        signal.reason += " [Low Volume: " + fixed(current.volume, 0) + "]";
        LOG_DEBUG("Confidence reduced due to low volume for {}", current.symbol);
    }

    return signal;
}

} // namespace strategy
} // namespace quantcore

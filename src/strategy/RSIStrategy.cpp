#include "strategy/RSIStrategy.h"
#include "common/Logger.h"
#include <algorithm>

namespace quantcore {
namespace strategy {

RSIStrategy::RSIStrategy(const RSIStrategyConfig& config,
                         std::shared_ptr<analytics::IndicatorService> indicators)
    : config_(config)
    , indicators_(std::move(indicators))
{
    LOG_INFO("RSI strategy initialized (period {}, oversold {:.1f}, overbought {:.1f})",
             config_.period, config_.oversold_threshold, config_.overbought_threshold);
}

StrategyInfo RSIStrategy::getInfo() const {
    return StrategyInfo("rsi", "RSI", "Wilder RSI mean reversion on oversold/overbought extremes");
}

Signal RSIStrategy::evaluate(const MarketData& current, const std::vector<MarketData>& bars) {
    double rsi = indicators_->calculateRSI(current.symbol, bars, config_.period);

    Signal signal;
    if (rsi < config_.oversold_threshold) {
        // Deeper below the threshold -> higher confidence
        double confidence = std::min((config_.oversold_threshold - rsi) / config_.oversold_threshold, 0.9);
        signal = makeSignal(current, SignalAction::BUY, confidence,
                            "RSI: " + fixed(rsi, 1) + " (OVERSOLD)");
        setExits(signal, 0.97, 1.06);
    } else if (rsi > config_.overbought_threshold) {
        double confidence = std::min((rsi - config_.overbought_threshold) /
                                     (100.0 - config_.overbought_threshold), 0.9);
        signal = makeSignal(current, SignalAction::SELL, confidence,
                            "RSI: " + fixed(rsi, 1) + " (OVERBOUGHT)");
        setExits(signal, 1.03, 0.94);
    } else {
        signal = makeSignal(current, SignalAction::HOLD, 0.4,
                            "RSI: " + fixed(rsi, 1) + " (NEUTRAL)");
        LOG_DEBUG("HOLD for {}: RSI in neutral zone", current.symbol);
    }

    return signal;
}

} // namespace strategy
} // namespace quantcore

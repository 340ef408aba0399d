#include "strategy/MomentumStrategy.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace quantcore {
namespace strategy {

MomentumStrategy::MomentumStrategy(const MomentumStrategyConfig& config,
                                   std::shared_ptr<analytics::IndicatorService> indicators)
    : config_(config)
    , indicators_(std::move(indicators))
{
    LOG_INFO("Momentum strategy initialized (buy {:+.2f}%, sell {:+.2f}%, volatility filter {:.2f})",
             config_.buy_threshold, config_.sell_threshold, config_.volatility_filter);
}

StrategyInfo MomentumStrategy::getInfo() const {
    return StrategyInfo("momentum", "Momentum", "Single-bar momentum with a volatility filter");
}

Signal MomentumStrategy::evaluate(const MarketData& current, const std::vector<MarketData>& bars) {
    const double change_pct = current.changePercent();
    const double volatility = indicators_->calculateVolatility(current.symbol, bars,
                                                               config_.volatility_period);
    const std::string momentum = "Momentum: " + signedFixed(change_pct, 2) + "% change";

    Signal signal;
    if (volatility >= config_.volatility_filter) {
        // Too noisy to trust the bar, regardless of direction
        signal = makeSignal(current, SignalAction::HOLD, 0.3,
                            momentum + ", High Volatility: " + fixed(volatility, 4) + " (FILTERED)");
        LOG_DEBUG("Signal filtered due to high volatility for {}", current.symbol);
    } else if (change_pct > config_.buy_threshold) {
        signal = makeSignal(current, SignalAction::BUY, std::min(std::abs(change_pct) / 5.0, 0.95),
                            momentum + " (STRONG UPWARD), Volatility: " + fixed(volatility, 4));
        setExits(signal, 0.98, 1.05);
    } else if (change_pct < config_.sell_threshold) {
        signal = makeSignal(current, SignalAction::SELL, std::min(std::abs(change_pct) / 5.0, 0.95),
                            momentum + " (STRONG DOWNWARD), Volatility: " + fixed(volatility, 4));
        setExits(signal, 1.02, 0.95);
    } else {
        signal = makeSignal(current, SignalAction::HOLD, 0.3, momentum);
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

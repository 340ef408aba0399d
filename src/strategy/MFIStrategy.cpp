#include "strategy/MFIStrategy.h"
#include "common/Logger.h"
#include <algorithm>

namespace quantcore {
namespace strategy {

MFIStrategy::MFIStrategy(const MFIStrategyConfig& config,
                         std::shared_ptr<analytics::IndicatorService> indicators)
    : config_(config)
    , indicators_(std::move(indicators))
{
    LOG_INFO("MFI strategy initialized (period {}, oversold {:.1f}, overbought {:.1f})",
             config_.period, config_.oversold_threshold, config_.overbought_threshold);
}

StrategyInfo MFIStrategy::getInfo() const {
    return StrategyInfo("mfi", "MFI", "Money Flow Index reversal on volume-weighted extremes");
}

Signal MFIStrategy::evaluate(const MarketData& current, const std::vector<MarketData>& bars) {
    double mfi = indicators_->calculateMFI(current.symbol, bars, config_.period);

    Signal signal;
    if (mfi < config_.oversold_threshold) {
        double confidence = std::clamp((config_.oversold_threshold - mfi) / config_.oversold_threshold, 0.5, 0.9);
        signal = makeSignal(current, SignalAction::BUY, confidence,
                            "MFI: " + fixed(mfi, 1) + " (OVERSOLD - Money flowing out, potential reversal)");
        setExits(signal, 0.97, 1.06);
    } else if (mfi > config_.overbought_threshold) {
        double confidence = std::clamp((mfi - config_.overbought_threshold) /
                                       (100.0 - config_.overbought_threshold), 0.5, 0.9);
        signal = makeSignal(current, SignalAction::SELL, confidence,
                            "MFI: " + fixed(mfi, 1) + " (OVERBOUGHT - Heavy buying, potential reversal)");
        setExits(signal, 1.03, 0.94);
    } else {
        signal = makeSignal(current, SignalAction::HOLD, 0.4,
                            "MFI: " + fixed(mfi, 1) + " (NEUTRAL - Balanced money flow)");
    }

    // MFI already weighs volume, so the penalty is lighter
    if (current.volume < config_.min_volume_threshold) {
        signal.confidence *= 0.8;
        signal.reason += " [Low Volume: " + fixed(current.volume, 0) + "]";
        LOG_DEBUG("Confidence slightly reduced due to low volume for {}", current.symbol);
    }

    return signal;
}

} // namespace strategy
} // namespace quantcore

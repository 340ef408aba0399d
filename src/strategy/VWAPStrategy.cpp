#include "strategy/VWAPStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace quantcore {
namespace strategy {

VWAPStrategy::VWAPStrategy(const VWAPStrategyConfig& config,
                           std::shared_ptr<analytics::IndicatorService> indicators)
    : config_(config)
    , indicators_(std::move(indicators))
{
    LOG_INFO("VWAP strategy initialized (period {}, band {:+.2f}% / {:+.2f}%)",
             config_.period, config_.buy_deviation_threshold, config_.sell_deviation_threshold);
}

StrategyInfo VWAPStrategy::getInfo() const {
    return StrategyInfo("vwap", "VWAP", "Mean reversion toward the rolling VWAP");
}

Signal VWAPStrategy::evaluate(const MarketData& current, const std::vector<MarketData>& bars) {
    const double vwap = indicators_->calculateVWAP(current.symbol, bars, config_.period);
    if (vwap <= 0.0) {
        throw ComputationError("VWAP is not positive");
    }

    const double price = current.close;
    const double deviation_pct = (price - vwap) / vwap * 100.0;
    const std::string deviation = "(Deviation: " + signedFixed(deviation_pct, 2) + "%, ";

    auto confidenceFor = [&](double threshold) {
        if (threshold == 0.0) return 0.9;
        return std::clamp(std::abs(deviation_pct) / std::abs(threshold) * 0.6, 0.5, 0.9);
    };

    Signal signal;
    if (deviation_pct < config_.buy_deviation_threshold) {
        signal = makeSignal(current, SignalAction::BUY, confidenceFor(config_.buy_deviation_threshold),
                            "Price: " + fixed(price, 2) + " < VWAP: " + fixed(vwap, 2) + " " +
                            deviation + "DISCOUNT)");
        signal.stop_loss = price * 0.97;
        signal.take_profit = vwap * 1.005;
    } else if (deviation_pct > config_.sell_deviation_threshold) {
        signal = makeSignal(current, SignalAction::SELL, confidenceFor(config_.sell_deviation_threshold),
                            "Price: " + fixed(price, 2) + " > VWAP: " + fixed(vwap, 2) + " " +
                            deviation + "PREMIUM)");
        signal.stop_loss = price * 1.03;
        signal.take_profit = vwap * 0.995;
    } else {
        signal = makeSignal(current, SignalAction::HOLD, 0.4,
                            "Price: " + fixed(price, 2) + " ~ VWAP: " + fixed(vwap, 2) + " " +
                            deviation + "FAIR VALUE)");
    }

    if (config_.use_volume_confirmation) {
        size_t window = std::min(bars.size(), static_cast<size_t>(std::max(config_.period, 1)));
        double volume_sum = 0.0;
        for (size_t i = bars.size() - window; i < bars.size(); ++i) {
            volume_sum += bars[i].volume;
        }
        double avg_volume = window > 0 ? volume_sum / window : 0.0;

        if (current.volume > avg_volume * 1.2) {
            signal.confidence = std::min(signal.confidence * 1.1, 0.95);
            signal.reason += " [High Volume Confirmation]";
        } else if (current.volume < avg_volume * 0.5) {
            signal.confidence *= 0.8;
            signal.reason += " [Low Volume: " + fixed(current.volume, 0) + "]";
        }
    }

    return signal;
}

} // namespace strategy
} // namespace quantcore

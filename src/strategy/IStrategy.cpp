#include "strategy/IStrategy.h"
#include "common/Logger.h"
#include <iomanip>
#include <sstream>

namespace quantcore {
namespace strategy {

Signal IStrategy::analyze(const MarketData& current, const std::vector<MarketData>& history) {
    std::vector<MarketData> bars;
    bars.reserve(history.size() + 1);
    bars.insert(bars.end(), history.begin(), history.end());
    bars.push_back(current);

    try {
        Signal signal = evaluate(current, bars);
        if (signal.action != SignalAction::HOLD) {
            LOG_INFO("{} signal from {} for {}: {}",
                     toString(signal.action), signal.strategy_name, signal.symbol, signal.reason);
        }
        return signal;
    } catch (const std::exception& e) {
        LOG_ERROR("Error analyzing {} with {} strategy: {}", current.symbol, name(), e.what());
        return makeSignal(current, SignalAction::HOLD, 0.0, std::string("Error: ") + e.what());
    } catch (...) {
        LOG_ERROR("Unknown error analyzing {} with {} strategy", current.symbol, name());
        return makeSignal(current, SignalAction::HOLD, 0.0, "Error: unknown");
    }
}

Signal IStrategy::makeSignal(const MarketData& current, SignalAction action,
                             double confidence, std::string reason) const {
    Signal signal;
    signal.symbol = current.symbol;
    signal.strategy_name = getInfo().display_name;
    signal.timestamp = current.timestamp;
    signal.action = action;
    signal.confidence = confidence;
    signal.reason = std::move(reason);
    signal.entry_price = current.close;
    return signal;
}

void IStrategy::setExits(Signal& signal, double stop_mult, double take_mult) {
    signal.stop_loss = signal.entry_price * stop_mult;
    signal.take_profit = signal.entry_price * take_mult;
}

std::string IStrategy::fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string IStrategy::signedFixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::showpos << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace strategy
} // namespace quantcore

#pragma once

#include "strategy/IStrategy.h"
#include "analytics/IndicatorService.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quantcore {
namespace strategy {

// Strategy registry and fan-out. Built-in factories ("rsi", "macd",
// "momentum", "mfi", "vwap") read their settings from Config.
class StrategyManager {
public:
    using Factory = std::function<std::shared_ptr<IStrategy>(std::shared_ptr<analytics::IndicatorService>)>;

    explicit StrategyManager(std::shared_ptr<analytics::IndicatorService> indicators);

    // Names are case-insensitive. Re-registering a name replaces the factory.
    void registerFactory(const std::string& name, Factory factory);
    // Throws InvalidParameterError for unknown names
    std::shared_ptr<IStrategy> createStrategy(const std::string& name) const;
    std::vector<std::string> getAvailableStrategies() const;

    void registerStrategy(std::shared_ptr<IStrategy> strategy);
    // Creates and registers every name; unknown names are logged and skipped.
    size_t loadStrategies(const std::vector<std::string>& names);

    std::shared_ptr<IStrategy> getStrategy(const std::string& name) const;
    std::vector<std::shared_ptr<IStrategy>> getStrategies() const;

    // One signal per registered strategy, in registration order
    std::vector<Signal> collectSignals(const MarketData& current,
                                       const std::vector<MarketData>& history);

    // Highest-confidence BUY/SELL; HOLD when nothing actionable
    static Signal selectBestSignal(const std::vector<Signal>& signals);

private:
    std::shared_ptr<analytics::IndicatorService> indicators_;
    std::map<std::string, Factory> factories_;
    std::vector<std::shared_ptr<IStrategy>> strategies_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace quantcore

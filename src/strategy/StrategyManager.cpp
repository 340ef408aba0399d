#include "strategy/StrategyManager.h"
#include "strategy/RSIStrategy.h"
#include "strategy/MACDStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/MFIStrategy.h"
#include "strategy/VWAPStrategy.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>

namespace quantcore {
namespace strategy {
namespace {
std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
}

StrategyManager::StrategyManager(std::shared_ptr<analytics::IndicatorService> indicators)
    : indicators_(std::move(indicators))
{
    factories_["rsi"] = [](std::shared_ptr<analytics::IndicatorService> svc) {
        return std::make_shared<RSIStrategy>(Config::getInstance().getRSIConfig(), svc);
    };
    factories_["macd"] = [](std::shared_ptr<analytics::IndicatorService> svc) {
        return std::make_shared<MACDStrategy>(Config::getInstance().getMACDConfig(), svc);
    };
    factories_["momentum"] = [](std::shared_ptr<analytics::IndicatorService> svc) {
        return std::make_shared<MomentumStrategy>(Config::getInstance().getMomentumConfig(), svc);
    };
    factories_["mfi"] = [](std::shared_ptr<analytics::IndicatorService> svc) {
        return std::make_shared<MFIStrategy>(Config::getInstance().getMFIConfig(), svc);
    };
    factories_["vwap"] = [](std::shared_ptr<analytics::IndicatorService> svc) {
        return std::make_shared<VWAPStrategy>(Config::getInstance().getVWAPConfig(), svc);
    };

    LOG_INFO("StrategyManager initialized ({} factories)", factories_.size());
}

void StrategyManager::registerFactory(const std::string& name, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[toLowerCopy(name)] = std::move(factory);
}

std::shared_ptr<IStrategy> StrategyManager::createStrategy(const std::string& name) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(toLowerCopy(name));
        if (it == factories_.end()) {
            throw InvalidParameterError("Unknown strategy: " + name);
        }
        factory = it->second;
    }
    return factory(indicators_);
}

std::vector<std::string> StrategyManager::getAvailableStrategies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& kv : factories_) {
        names.push_back(kv.first);
    }
    return names;
}

void StrategyManager::registerStrategy(std::shared_ptr<IStrategy> strategy) {
    if (!strategy) {
        throw InvalidParameterError("strategy must not be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto info = strategy->getInfo();
    strategies_.push_back(std::move(strategy));
    LOG_INFO("Strategy registered: {} ({})", info.display_name, info.description);
}

size_t StrategyManager::loadStrategies(const std::vector<std::string>& names) {
    size_t loaded = 0;
    for (const auto& name : names) {
        try {
            registerStrategy(createStrategy(name));
            ++loaded;
        } catch (const InvalidParameterError& e) {
            LOG_WARN("Skipping strategy '{}': {}", name, e.what());
        }
    }
    return loaded;
}

std::shared_ptr<IStrategy> StrategyManager::getStrategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = toLowerCopy(name);
    for (const auto& strategy : strategies_) {
        if (strategy->name() == key) {
            return strategy;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<IStrategy>> StrategyManager::getStrategies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_;
}

std::vector<Signal> StrategyManager::collectSignals(
    const MarketData& current,
    const std::vector<MarketData>& history
) {
    auto strategies = getStrategies();

    std::vector<Signal> signals;
    signals.reserve(strategies.size());
    for (auto& strategy : strategies) {
        signals.push_back(strategy->analyze(current, history));
    }

    LOG_DEBUG("{} - strategy analysis complete ({} signals)", current.symbol, signals.size());
    return signals;
}

Signal StrategyManager::selectBestSignal(const std::vector<Signal>& signals) {
    const Signal* best = nullptr;
    for (const auto& signal : signals) {
        if (signal.action == SignalAction::HOLD) {
            continue;
        }
        if (!best || signal.confidence > best->confidence) {
            best = &signal;
        }
    }

    if (best) {
        return *best;
    }

    Signal hold;
    if (!signals.empty()) {
        hold.symbol = signals.front().symbol;
        hold.timestamp = signals.front().timestamp;
        hold.entry_price = signals.front().entry_price;
    }
    hold.reason = "No actionable signal";
    return hold;
}

} // namespace strategy
} // namespace quantcore

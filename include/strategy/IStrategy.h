#pragma once

#include "common/Types.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quantcore {
namespace strategy {

enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        default: return "HOLD";
    }
}

struct Signal {
    std::string symbol;
    std::string strategy_name;
    Timestamp timestamp;
    SignalAction action;
    double confidence;                  // 0.0 ~ 1.0
    std::string reason;
    double entry_price;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;

    Signal()
        : timestamp(0)
        , action(SignalAction::HOLD)
        , confidence(0.0)
        , entry_price(0.0)
    {}
};

struct StrategyInfo {
    std::string name;           // registry key, lower case
    std::string display_name;
    std::string description;

    StrategyInfo() = default;
    StrategyInfo(std::string n, std::string d, std::string desc)
        : name(std::move(n)), display_name(std::move(d)), description(std::move(desc)) {}
};

// Strategy interface. analyze() is total: evaluation failures become a
// HOLD signal with confidence 0 and an "Error: ..." reason.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;
    std::string name() const { return getInfo().name; }

    // `history` holds the bars before `current`, oldest first.
    Signal analyze(const MarketData& current, const std::vector<MarketData>& history);

protected:
    // May throw; analyze() converts any exception into a HOLD signal.
    virtual Signal evaluate(const MarketData& current, const std::vector<MarketData>& bars) = 0;

    Signal makeSignal(const MarketData& current, SignalAction action,
                      double confidence, std::string reason) const;

    // Sets stop/take-profit as multiples of the entry price.
    static void setExits(Signal& signal, double stop_mult, double take_mult);

    static std::string fixed(double value, int precision);
    // "+3.00" style
    static std::string signedFixed(double value, int precision);
};

} // namespace strategy
} // namespace quantcore

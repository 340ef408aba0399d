#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "analytics/IndicatorService.h"
#include <memory>

namespace quantcore {
namespace strategy {

class MACDStrategy : public IStrategy {
public:
    MACDStrategy(const MACDStrategyConfig& config,
                 std::shared_ptr<analytics::IndicatorService> indicators);

    StrategyInfo getInfo() const override;
    const MACDStrategyConfig& config() const { return config_; }

protected:
    Signal evaluate(const MarketData& current, const std::vector<MarketData>& bars) override;

private:
    MACDStrategyConfig config_;
    std::shared_ptr<analytics::IndicatorService> indicators_;
};

} // namespace strategy
} // namespace quantcore

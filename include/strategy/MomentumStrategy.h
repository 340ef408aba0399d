#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "analytics/IndicatorService.h"
#include <memory>

namespace quantcore {
namespace strategy {

class MomentumStrategy : public IStrategy {
public:
    MomentumStrategy(const MomentumStrategyConfig& config,
                     std::shared_ptr<analytics::IndicatorService> indicators);

    StrategyInfo getInfo() const override;
    const MomentumStrategyConfig& config() const { return config_; }

protected:
    Signal evaluate(const MarketData& current, const std::vector<MarketData>& bars) override;

private:
    MomentumStrategyConfig config_;
    std::shared_ptr<analytics::IndicatorService> indicators_;
};

} // namespace strategy
} // namespace quantcore

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"
#include "marketmaking/MarketMakingConfig.h"

namespace quantcore {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);
    // Back to built-in defaults
    void reset();

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLogLevel() const { return engine_config_.log_level; }
    int getIndicatorCacheTtlSeconds() const { return engine_config_.indicator_cache_ttl_seconds; }
    int getIndicatorTimeBucketSeconds() const { return engine_config_.indicator_time_bucket_seconds; }
    void setEnabledStrategies(const std::vector<std::string>& v);

    // Strategy Configs
    strategy::RSIStrategyConfig getRSIConfig() const { return rsi_config_; }
    strategy::MACDStrategyConfig getMACDConfig() const { return macd_config_; }
    strategy::MomentumStrategyConfig getMomentumConfig() const { return momentum_config_; }
    strategy::MFIStrategyConfig getMFIConfig() const { return mfi_config_; }
    strategy::VWAPStrategyConfig getVWAPConfig() const { return vwap_config_; }

    marketmaking::MarketMakingConfig getMarketMakingConfig() const { return market_making_config_; }

private:
    Config() = default;

    engine::EngineConfig engine_config_;
    strategy::RSIStrategyConfig rsi_config_;
    strategy::MACDStrategyConfig macd_config_;
    strategy::MomentumStrategyConfig momentum_config_;
    strategy::MFIStrategyConfig mfi_config_;
    strategy::VWAPStrategyConfig vwap_config_;
    marketmaking::MarketMakingConfig market_making_config_;
};

} // namespace quantcore

#include "common/Config.h"
#include "common/Logger.h"
#include "marketmaking/ASParameters.h"

#include <cassert>
#include <cmath>
#include <iostream>

int main() {
    using namespace quantcore;

    Logger::getInstance().initializeConsoleOnly("warn");
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // Defaults
    {
        auto engine = config.getEngineConfig();
        assert(engine.indicator_cache_ttl_seconds == 60);
        assert(engine.enabled_strategies.size() == 5);
        assert(config.getRSIConfig().period == 14);
        assert(config.getMACDConfig().slow_period == 26);
        assert(std::abs(config.getMomentumConfig().volatility_filter - 0.15) < 1e-12);
        assert(config.getMFIConfig().min_volume_threshold == 50000.0);
        assert(config.getMarketMakingConfig().preset == "conservative");
    }

    // Overrides from JSON
    {
        auto j = nlohmann::json::parse(R"({
            "engine": {
                "log_level": "debug",
                "indicator_cache_ttl_seconds": 30,
                "indicator_time_bucket_seconds": 15,
                "enabled_strategies": [" RSI ", "Momentum"]
            },
            "strategies": {
                "rsi": {"period": 7, "oversold_threshold": 25.0},
                "momentum": {"volatility_filter": 0.3},
                "vwap": {"use_volume_confirmation": false}
            },
            "market_making": {
                "preset": "Custom",
                "gamma": 0.2,
                "max_inventory": 4.0,
                "max_spread_bps": 80.0
            }
        })");
        config.applyJson(j);

        auto engine = config.getEngineConfig();
        assert(engine.log_level == "debug");
        assert(engine.indicator_cache_ttl_seconds == 30);
        assert(engine.indicator_time_bucket_seconds == 15);
        assert(engine.enabled_strategies.size() == 2);
        assert(engine.enabled_strategies[0] == "rsi");
        assert(engine.enabled_strategies[1] == "momentum");

        auto rsi = config.getRSIConfig();
        assert(rsi.period == 7);
        assert(rsi.oversold_threshold == 25.0);
        assert(rsi.overbought_threshold == 70.0);

        assert(config.getMomentumConfig().volatility_filter == 0.3);
        assert(!config.getVWAPConfig().use_volume_confirmation);

        auto mm = config.getMarketMakingConfig();
        assert(mm.preset == "custom");
        assert(mm.gamma == 0.2);
        assert(mm.kappa == 1.5);

        auto params = marketmaking::ASParameters::fromConfig(mm);
        assert(params.gamma == 0.2);
        assert(params.max_inventory == 4.0);
        assert(params.max_spread_bps == 80.0);
    }

    // Out-of-range TTL keeps the previous value
    {
        config.applyJson(nlohmann::json::parse(R"({"engine": {"indicator_cache_ttl_seconds": 0}})"));
        assert(config.getEngineConfig().indicator_cache_ttl_seconds == 30);
    }

    // Missing file falls back to defaults without throwing
    {
        config.reset();
        config.load("does/not/exist.json");
        assert(config.getEngineConfig().indicator_cache_ttl_seconds == 60);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}

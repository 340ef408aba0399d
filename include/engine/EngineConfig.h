#pragma once

#include <string>
#include <vector>

namespace quantcore {
namespace engine {

struct EngineConfig {
    std::string log_level = "info";
    std::string log_dir = "logs";

    // Indicator cache
    int indicator_cache_ttl_seconds = 60;
    int indicator_time_bucket_seconds = 60;

    // Strategies run by StrategyManager (lower-case names)
    std::vector<std::string> enabled_strategies = {"rsi", "macd", "momentum", "mfi", "vwap"};
};

} // namespace engine
} // namespace quantcore

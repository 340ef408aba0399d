#pragma once

#include "analytics/IndicatorCache.h"
#include "engine/EngineConfig.h"
#include <map>
#include <string>
#include <vector>

namespace quantcore {
namespace analytics {

// Cached, symbol-aware front end over TechnicalIndicators.
// The typed methods are virtual so strategies can be driven with fixed
// indicator values in tests.
class IndicatorService {
public:
    using Params = std::map<std::string, double>;

    IndicatorService(std::chrono::seconds ttl = std::chrono::seconds(60), int time_bucket_seconds = 60);
    explicit IndicatorService(const engine::EngineConfig& config);
    virtual ~IndicatorService() = default;

    // Generic entry: indicator name is case-insensitive ("rsi", "macd",
    // "ema", "sma", "volatility", "mfi", "vwap", "stochastic", "adx", "atr",
    // "bollinger", "williams_r", "cci", "obv").
    // Throws InvalidParameterError for unknown names or bad params and
    // InsufficientDataError for short history.
    IndicatorValue compute(const std::string& indicator,
                           const std::string& symbol,
                           const std::vector<Candle>& history,
                           const Params& params = Params());

    virtual double calculateRSI(const std::string& symbol, const std::vector<Candle>& history,
                                int period = 14);
    virtual MACDResult calculateMACD(const std::string& symbol, const std::vector<Candle>& history,
                                     int fast = 12, int slow = 26, int signal = 9);
    virtual double calculateVolatility(const std::string& symbol, const std::vector<Candle>& history,
                                       int period = 20);
    virtual double calculateMFI(const std::string& symbol, const std::vector<Candle>& history,
                                int period = 14);
    virtual double calculateVWAP(const std::string& symbol, const std::vector<Candle>& history,
                                 int period = 20);

    void clearCache();
    const IndicatorCache& cache() const { return cache_; }

    // indicator|symbol|k=v,k=v|bucket|bars
    std::string makeKey(const std::string& indicator,
                        const std::string& symbol,
                        const std::vector<Candle>& history,
                        const Params& params) const;

private:
    // Minimum history for `indicator` under `params`; checked before any cache lookup
    size_t requiredHistory(const std::string& indicator, const Params& params) const;

    IndicatorValue evaluate(const std::string& indicator,
                            const std::vector<Candle>& history,
                            const Params& params) const;

    IndicatorCache cache_;
    long long bucket_ms_;
};

} // namespace analytics
} // namespace quantcore

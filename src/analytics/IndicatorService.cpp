#include "analytics/IndicatorService.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace quantcore {
namespace analytics {

namespace {
std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int intParam(const IndicatorService::Params& params, const char* name, int fallback) {
    auto it = params.find(name);
    if (it == params.end()) return fallback;
    double value = it->second;
    if (!std::isfinite(value) || value != std::floor(value)) {
        throw InvalidParameterError(std::string(name) + " must be an integer");
    }
    return static_cast<int>(value);
}

double doubleParam(const IndicatorService::Params& params, const char* name, double fallback) {
    auto it = params.find(name);
    return it == params.end() ? fallback : it->second;
}
}

IndicatorService::IndicatorService(std::chrono::seconds ttl, int time_bucket_seconds)
    : cache_(ttl)
    , bucket_ms_(static_cast<long long>(std::max(time_bucket_seconds, 1)) * 1000)
{
}

IndicatorService::IndicatorService(const engine::EngineConfig& config)
    : IndicatorService(std::chrono::seconds(config.indicator_cache_ttl_seconds),
                       config.indicator_time_bucket_seconds)
{
}

std::string IndicatorService::makeKey(
    const std::string& indicator,
    const std::string& symbol,
    const std::vector<Candle>& history,
    const Params& params
) const {
    std::ostringstream key;
    key << toLowerCopy(indicator) << '|' << symbol << '|';

    bool first = true;
    for (const auto& kv : params) {
        if (!first) key << ',';
        key << kv.first << '=' << kv.second;
        first = false;
    }

    Timestamp latest = history.empty() ? 0 : history.back().timestamp;
    key << '|' << (latest / bucket_ms_) << '|' << history.size();
    return key.str();
}

IndicatorValue IndicatorService::compute(
    const std::string& indicator,
    const std::string& symbol,
    const std::vector<Candle>& history,
    const Params& params
) {
    if (history.empty()) {
        throw InsufficientDataError(indicator, 1, 0);
    }

    const std::string name = toLowerCopy(indicator);
    const size_t required = requiredHistory(name, params);
    if (history.size() < required) {
        throw InsufficientDataError(name, required, history.size());
    }

    const std::string& sym = symbol.empty() ? history.back().symbol : symbol;
    const std::string key = makeKey(name, sym, history, params);

    return cache_.getOrCompute(key, [&]() {
        LOG_DEBUG("Computing {} for {} ({} bars)", name, sym, history.size());
        return evaluate(name, history, params);
    });
}

size_t IndicatorService::requiredHistory(const std::string& name, const Params& params) const {
    if (name == "macd") {
        return TechnicalIndicators::requiredBars(name, intParam(params, "fast", 12),
                                                 intParam(params, "slow", 26), intParam(params, "signal", 9));
    }
    if (name == "stochastic") {
        return TechnicalIndicators::requiredBars(name, intParam(params, "period", 14),
                                                 intParam(params, "smooth_k", 3), intParam(params, "smooth_d", 3));
    }
    if (name == "obv") {
        return TechnicalIndicators::requiredBars(name, 0);
    }
    if (name == "ema" || name == "sma" || name == "volatility" || name == "vwap" ||
        name == "bollinger" || name == "cci") {
        return TechnicalIndicators::requiredBars(name, intParam(params, "period", 20));
    }
    if (name == "rsi" || name == "mfi" || name == "adx" || name == "atr" ||
        name == "williams_r" || name == "williamsr") {
        return TechnicalIndicators::requiredBars(name, intParam(params, "period", 14));
    }
    throw InvalidParameterError("Unknown indicator: " + name);
}

IndicatorValue IndicatorService::evaluate(
    const std::string& name,
    const std::vector<Candle>& history,
    const Params& params
) const {
    if (name == "rsi") {
        return TechnicalIndicators::calculateRSI(
            TechnicalIndicators::extractClosePrices(history), intParam(params, "period", 14));
    }
    if (name == "macd") {
        return TechnicalIndicators::calculateMACD(
            TechnicalIndicators::extractClosePrices(history),
            intParam(params, "fast", 12), intParam(params, "slow", 26), intParam(params, "signal", 9));
    }
    if (name == "ema") {
        return TechnicalIndicators::calculateEMA(
            TechnicalIndicators::extractClosePrices(history), intParam(params, "period", 20));
    }
    if (name == "sma") {
        return TechnicalIndicators::calculateSMA(
            TechnicalIndicators::extractClosePrices(history), intParam(params, "period", 20));
    }
    if (name == "volatility") {
        return TechnicalIndicators::calculateVolatility(
            TechnicalIndicators::extractClosePrices(history), intParam(params, "period", 20));
    }
    if (name == "mfi") {
        return TechnicalIndicators::calculateMFI(history, intParam(params, "period", 14));
    }
    if (name == "vwap") {
        return TechnicalIndicators::calculateVWAP(history, intParam(params, "period", 20));
    }
    if (name == "stochastic") {
        return TechnicalIndicators::calculateStochastic(
            history, intParam(params, "period", 14),
            intParam(params, "smooth_k", 3), intParam(params, "smooth_d", 3));
    }
    if (name == "adx") {
        return TechnicalIndicators::calculateADX(history, intParam(params, "period", 14));
    }
    if (name == "atr") {
        return TechnicalIndicators::calculateATR(history, intParam(params, "period", 14));
    }
    if (name == "bollinger") {
        return TechnicalIndicators::calculateBollingerBands(
            TechnicalIndicators::extractClosePrices(history),
            intParam(params, "period", 20), doubleParam(params, "std_dev", 2.0));
    }
    if (name == "williams_r" || name == "williamsr") {
        return TechnicalIndicators::calculateWilliamsR(history, intParam(params, "period", 14));
    }
    if (name == "cci") {
        return TechnicalIndicators::calculateCCI(history, intParam(params, "period", 20));
    }
    if (name == "obv") {
        return TechnicalIndicators::calculateOBV(history);
    }

    throw InvalidParameterError("Unknown indicator: " + name);
}

double IndicatorService::calculateRSI(const std::string& symbol,
                                      const std::vector<Candle>& history, int period) {
    return std::get<double>(compute("rsi", symbol, history, {{"period", period}}));
}

MACDResult IndicatorService::calculateMACD(const std::string& symbol,
                                           const std::vector<Candle>& history,
                                           int fast, int slow, int signal) {
    return std::get<MACDResult>(compute("macd", symbol, history,
                                        {{"fast", fast}, {"slow", slow}, {"signal", signal}}));
}

double IndicatorService::calculateVolatility(const std::string& symbol,
                                             const std::vector<Candle>& history, int period) {
    return std::get<double>(compute("volatility", symbol, history, {{"period", period}}));
}

double IndicatorService::calculateMFI(const std::string& symbol,
                                      const std::vector<Candle>& history, int period) {
    return std::get<double>(compute("mfi", symbol, history, {{"period", period}}));
}

double IndicatorService::calculateVWAP(const std::string& symbol,
                                       const std::vector<Candle>& history, int period) {
    return std::get<double>(compute("vwap", symbol, history, {{"period", period}}));
}

void IndicatorService::clearCache() {
    cache_.clear();
    LOG_INFO("Indicator cache cleared");
}

} // namespace analytics
} // namespace quantcore

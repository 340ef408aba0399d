#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace quantcore {
namespace analytics {

namespace {

void requirePeriod(const char* indicator, int period) {
    if (period <= 0) {
        throw InvalidParameterError(std::string(indicator) + " period must be positive (got " +
                                    std::to_string(period) + ")");
    }
}

void requireBars(const char* indicator, size_t required, size_t actual) {
    if (actual < required) {
        throw InsufficientDataError(indicator, required, actual);
    }
}

double requireFinite(const char* indicator, double value) {
    if (!std::isfinite(value)) {
        throw ComputationError(std::string(indicator) + " produced a non-finite value");
    }
    return value;
}

}

size_t TechnicalIndicators::requiredBars(const std::string& indicator, int period,
                                         int second, int third) {
    const size_t p = static_cast<size_t>(std::max(period, 0));
    if (indicator == "obv") {
        return 2;
    }
    if (indicator == "macd") {
        // period = fast, second = slow, third = signal
        return static_cast<size_t>(std::max(second, 0) + std::max(third, 0));
    }
    if (indicator == "stochastic") {
        const size_t smoothed = p + static_cast<size_t>(std::max(second, 1) + std::max(third, 1)) - 2;
        return std::max(p + 1, smoothed);
    }
    if (indicator == "adx") {
        return std::max(p + 1, p * 2);
    }
    return p + 1;
}

// RSI (Wilder's smoothing)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    requirePeriod("RSI", period);
    requireBars("RSI", requiredBars("rsi", period), prices.size());

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // Seed with the simple average of the first `period` changes
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss <= 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return requireFinite("RSI", 100.0 - (100.0 / (1.0 + rs)));
}

MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    requirePeriod("MACD fast", fast);
    requirePeriod("MACD slow", slow);
    requirePeriod("MACD signal", signal_period);
    if (fast >= slow) {
        throw InvalidParameterError("MACD fast period (" + std::to_string(fast) +
                                    ") must be shorter than slow period (" + std::to_string(slow) + ")");
    }
    requireBars("MACD", requiredBars("macd", fast, slow, signal_period), prices.size());

    auto fast_ema_vec = emaSeries(prices, fast);
    auto slow_ema_vec = emaSeries(prices, slow);

    // Align both series on their newest values
    std::vector<double> macd_series;
    size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    size_t offset_fast = fast_ema_vec.size() - min_size;
    size_t offset_slow = slow_ema_vec.size() - min_size;
    macd_series.reserve(min_size);

    for (size_t i = 0; i < min_size; ++i) {
        macd_series.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }

    auto signal_series = emaSeries(macd_series, signal_period);

    MACDResult result;
    result.macd = requireFinite("MACD", macd_series.back());
    result.signal = requireFinite("MACD", signal_series.back());
    result.histogram = result.macd - result.signal;
    return result;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    requirePeriod("EMA", period);
    requireBars("EMA", requiredBars("ema", period), prices.size());
    return requireFinite("EMA", emaSeries(prices, period).back());
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    requirePeriod("EMA", period);
    requireBars("EMA", requiredBars("ema", period), prices.size());
    return emaSeries(prices, period);
}

std::vector<double> TechnicalIndicators::emaSeries(const std::vector<double>& values, int period) {
    std::vector<double> ema_values;
    if (values.size() < static_cast<size_t>(period)) return ema_values;

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += values[i];
    ema /= period;

    ema_values.reserve(values.size() - period + 1);
    ema_values.push_back(ema);

    for (size_t i = period; i < values.size(); ++i) {
        ema = (values[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    requirePeriod("SMA", period);
    requireBars("SMA", requiredBars("sma", period), prices.size());

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }
    return requireFinite("SMA", sum / period);
}

double TechnicalIndicators::calculateVolatility(const std::vector<double>& prices, int period) {
    requirePeriod("Volatility", period);
    requireBars("Volatility", requiredBars("volatility", period), prices.size());

    std::vector<double> returns;
    returns.reserve(period);
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        const double prev = prices[i - 1];
        if (prev <= 0.0) {
            throw ComputationError("Volatility requires positive prices");
        }
        returns.push_back((prices[i] - prev) / prev);
    }

    double mean = calculateMean(returns);
    return requireFinite("Volatility", calculateStandardDeviation(returns, mean));
}

double TechnicalIndicators::calculateMFI(const std::vector<Candle>& candles, int period) {
    requirePeriod("MFI", period);
    requireBars("MFI", requiredBars("mfi", period), candles.size());

    double positive_flow = 0.0;
    double negative_flow = 0.0;

    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        double typical = candles[i].typicalPrice();
        double prev_typical = candles[i - 1].typicalPrice();
        double money_flow = typical * candles[i].volume;

        if (typical > prev_typical) positive_flow += money_flow;
        else if (typical < prev_typical) negative_flow += money_flow;
    }

    if (positive_flow + negative_flow <= 0.0) return 50.0;
    if (negative_flow <= 0.0) return 100.0;

    double ratio = positive_flow / negative_flow;
    return requireFinite("MFI", 100.0 - (100.0 / (1.0 + ratio)));
}

double TechnicalIndicators::calculateVWAP(const std::vector<Candle>& candles, int period) {
    requirePeriod("VWAP", period);
    requireBars("VWAP", requiredBars("vwap", period), candles.size());

    double pv_sum = 0.0;
    double volume_sum = 0.0;
    double typical_sum = 0.0;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        double typical = candles[i].typicalPrice();
        pv_sum += typical * candles[i].volume;
        volume_sum += candles[i].volume;
        typical_sum += typical;
    }

    // No traded volume in the window: plain mean of typical price
    if (volume_sum <= 0.0) {
        return requireFinite("VWAP", typical_sum / period);
    }
    return requireFinite("VWAP", pv_sum / volume_sum);
}

StochasticResult TechnicalIndicators::calculateStochastic(
    const std::vector<Candle>& candles,
    int period,
    int smooth_k,
    int smooth_d
) {
    requirePeriod("Stochastic", period);
    requirePeriod("Stochastic smoothK", smooth_k);
    requirePeriod("Stochastic smoothD", smooth_d);
    requireBars("Stochastic", requiredBars("stochastic", period, smooth_k, smooth_d), candles.size());

    // Raw %K for every full window
    std::vector<double> raw_k;
    raw_k.reserve(candles.size());
    for (size_t end = period - 1; end < candles.size(); ++end) {
        size_t start = end + 1 - period;
        double highest = candles[start].high;
        double lowest = candles[start].low;
        for (size_t i = start + 1; i <= end; ++i) {
            highest = std::max(highest, candles[i].high);
            lowest = std::min(lowest, candles[i].low);
        }
        double range = highest - lowest;
        if (range <= 0.0) {
            raw_k.push_back(50.0);
        } else {
            double k = (candles[end].close - lowest) / range * 100.0;
            raw_k.push_back(std::clamp(k, 0.0, 100.0));
        }
    }

    // Smoothed %K series (SMA over smooth_k)
    std::vector<double> smoothed_k;
    for (size_t end = smooth_k - 1; end < raw_k.size(); ++end) {
        double sum = 0.0;
        for (size_t i = end + 1 - smooth_k; i <= end; ++i) sum += raw_k[i];
        smoothed_k.push_back(sum / smooth_k);
    }

    double d_sum = 0.0;
    for (size_t i = smoothed_k.size() - smooth_d; i < smoothed_k.size(); ++i) {
        d_sum += smoothed_k[i];
    }

    StochasticResult result;
    result.percent_k = requireFinite("Stochastic", smoothed_k.back());
    result.percent_d = requireFinite("Stochastic", d_sum / smooth_d);
    return result;
}

ADXResult TechnicalIndicators::calculateADX(const std::vector<Candle>& candles, int period) {
    requirePeriod("ADX", period);
    requireBars("ADX", requiredBars("adx", period), candles.size());

    std::vector<double> tr_vec, dm_plus_vec, dm_minus_vec;
    tr_vec.reserve(candles.size());
    dm_plus_vec.reserve(candles.size());
    dm_minus_vec.reserve(candles.size());

    for (size_t i = 1; i < candles.size(); ++i) {
        tr_vec.push_back(trueRange(candles[i], candles[i - 1]));

        double up_move = candles[i].high - candles[i - 1].high;
        double down_move = candles[i - 1].low - candles[i].low;

        dm_plus_vec.push_back((up_move > down_move && up_move > 0) ? up_move : 0.0);
        dm_minus_vec.push_back((down_move > up_move && down_move > 0) ? down_move : 0.0);
    }

    // Wilder's running sum: first value is the plain sum, then prev - prev/p + current
    auto smooth = [period](const std::vector<double>& vec) {
        std::vector<double> smoothed;
        double sum = 0.0;
        for (int i = 0; i < period; ++i) sum += vec[i];
        smoothed.push_back(sum);
        double prev = sum;
        for (size_t i = period; i < vec.size(); ++i) {
            double current = prev - (prev / period) + vec[i];
            smoothed.push_back(current);
            prev = current;
        }
        return smoothed;
    };

    auto tr_smooth = smooth(tr_vec);
    auto dm_plus_smooth = smooth(dm_plus_vec);
    auto dm_minus_smooth = smooth(dm_minus_vec);

    std::vector<double> dx_vec;
    double plus_di = 0.0;
    double minus_di = 0.0;
    dx_vec.reserve(tr_smooth.size());
    for (size_t i = 0; i < tr_smooth.size(); ++i) {
        double tr = tr_smooth[i];
        if (tr <= 0.0) {
            plus_di = 0.0;
            minus_di = 0.0;
            dx_vec.push_back(0.0);
            continue;
        }

        plus_di = (dm_plus_smooth[i] / tr) * 100.0;
        minus_di = (dm_minus_smooth[i] / tr) * 100.0;

        double sum_di = plus_di + minus_di;
        dx_vec.push_back(sum_di <= 0.0 ? 0.0 : (std::abs(plus_di - minus_di) / sum_di) * 100.0);
    }

    // ADX: mean of the first `period` DX values, then Wilder-smoothed
    double adx = 0.0;
    for (int i = 0; i < period; ++i) adx += dx_vec[i];
    adx /= period;
    for (size_t i = period; i < dx_vec.size(); ++i) {
        adx = ((adx * (period - 1)) + dx_vec[i]) / period;
    }

    return ADXResult(requireFinite("ADX", adx),
                     requireFinite("ADX", plus_di),
                     requireFinite("ADX", minus_di));
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    requirePeriod("ATR", period);
    requireBars("ATR", requiredBars("atr", period), candles.size());

    std::vector<double> tr_values;
    tr_values.reserve(candles.size());
    for (size_t i = 1; i < candles.size(); ++i) {
        tr_values.push_back(trueRange(candles[i], candles[i - 1]));
    }

    // Seed with the plain average of the first `period` ranges
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return requireFinite("ATR", atr);
}

BollingerBandsResult TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    requirePeriod("Bollinger", period);
    requireBars("Bollinger", requiredBars("bollinger", period), prices.size());

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    BollingerBandsResult result;
    result.middle = calculateMean(recent_prices);
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = requireFinite("Bollinger", result.middle + (std_dev * std_dev_mult));
    result.lower = requireFinite("Bollinger", result.middle - (std_dev * std_dev_mult));
    return result;
}

double TechnicalIndicators::calculateWilliamsR(const std::vector<Candle>& candles, int period) {
    requirePeriod("WilliamsR", period);
    requireBars("WilliamsR", requiredBars("williams_r", period), candles.size());

    size_t start = candles.size() - period;
    double highest = candles[start].high;
    double lowest = candles[start].low;
    for (size_t i = start + 1; i < candles.size(); ++i) {
        highest = std::max(highest, candles[i].high);
        lowest = std::min(lowest, candles[i].low);
    }

    double range = highest - lowest;
    if (range <= 0.0) return -50.0;

    double value = (highest - candles.back().close) / range * -100.0;
    return requireFinite("WilliamsR", std::clamp(value, -100.0, 0.0));
}

double TechnicalIndicators::calculateCCI(const std::vector<Candle>& candles, int period) {
    requirePeriod("CCI", period);
    requireBars("CCI", requiredBars("cci", period), candles.size());

    std::vector<double> typical;
    typical.reserve(period);
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        typical.push_back(candles[i].typicalPrice());
    }

    double sma = calculateMean(typical);
    double mean_deviation = 0.0;
    for (double tp : typical) mean_deviation += std::abs(tp - sma);
    mean_deviation /= period;

    if (mean_deviation <= 0.0) return 0.0;
    return requireFinite("CCI", (typical.back() - sma) / (0.015 * mean_deviation));
}

double TechnicalIndicators::calculateOBV(const std::vector<Candle>& candles) {
    requireBars("OBV", requiredBars("obv", 0), candles.size());

    double obv = candles[0].volume;
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].close > candles[i - 1].close) obv += candles[i].volume;
        else if (candles[i].close < candles[i - 1].close) obv -= candles[i].volume;
    }
    return requireFinite("OBV", obv);
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;
    double sq_sum = 0.0;
    for (double v : values) sq_sum += (v - mean) * (v - mean);
    return std::sqrt(sq_sum / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::trueRange(const Candle& current, const Candle& previous) {
    double tr1 = current.high - current.low;
    double tr2 = std::abs(current.high - previous.close);
    double tr3 = std::abs(current.low - previous.close);
    return std::max({tr1, tr2, tr3});
}

} // namespace analytics
} // namespace quantcore

#pragma once

#include <vector>
#include <string>
#include "common/Types.h"

namespace quantcore {
namespace analytics {

struct MACDResult {
    double macd;        // fast EMA - slow EMA
    double signal;      // EMA of the MACD line
    double histogram;   // macd - signal

    MACDResult() : macd(0), signal(0), histogram(0) {}
    MACDResult(double m, double s, double h) : macd(m), signal(s), histogram(h) {}
};

struct StochasticResult {
    double percent_k;
    double percent_d;

    StochasticResult() : percent_k(0), percent_d(0) {}
    StochasticResult(double k, double d) : percent_k(k), percent_d(d) {}
};

struct ADXResult {
    double adx;
    double plus_di;
    double minus_di;

    ADXResult() : adx(0), plus_di(0), minus_di(0) {}
    ADXResult(double a, double p, double m) : adx(a), plus_di(p), minus_di(m) {}
};

struct BollingerBandsResult {
    double upper;
    double middle;      // SMA
    double lower;

    BollingerBandsResult() : upper(0), middle(0), lower(0) {}
    BollingerBandsResult(double u, double m, double l) : upper(u), middle(m), lower(l) {}
};

// Stateless indicator math over ordered (oldest first) series.
// Every function throws InsufficientDataError when the series is shorter
// than requiredBars() reports, and InvalidParameterError for non-positive
// periods. Nothing is silently defaulted.
class TechnicalIndicators {
public:
    // Wilder-smoothed RSI, 0..100. Average loss of zero yields 100.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    // SMA-seeded EMA, latest value
    static double calculateEMA(const std::vector<double>& prices, int period);
    // EMA series starting at index period-1 of the input
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // Mean of the latest `period` values
    static double calculateSMA(const std::vector<double>& prices, int period);

    // Population standard deviation of the last `period` simple returns
    static double calculateVolatility(const std::vector<double>& prices, int period = 20);

    // Money Flow Index, 0..100. No money flow in either direction yields 50.
    static double calculateMFI(const std::vector<Candle>& candles, int period = 14);

    // Volume-weighted typical price over the last `period` bars
    static double calculateVWAP(const std::vector<Candle>& candles, int period = 20);

    static StochasticResult calculateStochastic(const std::vector<Candle>& candles,
                                                int period = 14, int smooth_k = 3, int smooth_d = 3);

    static ADXResult calculateADX(const std::vector<Candle>& candles, int period = 14);

    // Wilder-smoothed true range
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    static BollingerBandsResult calculateBollingerBands(const std::vector<double>& prices,
                                                        int period = 20,
                                                        double std_dev_mult = 2.0);

    // -100..0. Zero high/low range yields -50.
    static double calculateWilliamsR(const std::vector<Candle>& candles, int period = 14);

    // Zero mean deviation yields 0.
    static double calculateCCI(const std::vector<Candle>& candles, int period = 20);

    // Cumulative signed volume seeded with the first bar's volume. Needs 2 bars.
    static double calculateOBV(const std::vector<Candle>& candles);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    // Minimum history length accepted by each indicator
    static size_t requiredBars(const std::string& indicator, int period,
                               int second = 0, int third = 0);

private:
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);
    static std::vector<double> emaSeries(const std::vector<double>& values, int period);
    static double trueRange(const Candle& current, const Candle& previous);
};

} // namespace analytics
} // namespace quantcore

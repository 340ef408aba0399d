#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace quantcore;
using quantcore::analytics::TechnicalIndicators;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

std::vector<Candle> flatCandles(size_t count, double price, double volume) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < count; ++i) {
        candles.emplace_back("TEST", price, price, price, price, volume,
                             static_cast<Timestamp>(i) * 60000);
    }
    return candles;
}

// Bars oscillating around 100 with a real high/low range
std::vector<Candle> wavyCandles(size_t count) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < count; ++i) {
        double close = 100.0 + 5.0 * std::sin(static_cast<double>(i) * 0.4) + 0.1 * i;
        double open = close - 0.5;
        candles.emplace_back("TEST", open, close + 1.0, open - 1.0, close,
                             1000.0 + 10.0 * i, static_cast<Timestamp>(i) * 60000);
    }
    return candles;
}

}

int main() {
    // RSI: only gains -> 100
    {
        std::vector<double> prices;
        for (int i = 0; i < 20; ++i) prices.push_back(100.0 + i);
        assert(TechnicalIndicators::calculateRSI(prices, 14) == 100.0);
    }

    // RSI: 20-bar decline reads oversold, a 20-bar recovery pushes it overbought
    {
        std::vector<double> prices;
        for (int i = 0; i <= 20; ++i) prices.push_back(100.0 - i);
        double oversold = TechnicalIndicators::calculateRSI(prices, 14);
        assert(oversold < 30.0);

        for (int i = 1; i <= 20; ++i) prices.push_back(80.0 + i);
        double overbought = TechnicalIndicators::calculateRSI(prices, 14);
        assert(overbought > 70.0);
        assert(overbought <= 100.0);
    }

    // RSI: one bar short
    {
        std::vector<double> prices(14, 100.0);
        bool thrown = false;
        try {
            TechnicalIndicators::calculateRSI(prices, 14);
        } catch (const InsufficientDataError& e) {
            thrown = true;
            assert(e.required() == 15);
            assert(e.actual() == 14);
        }
        assert(thrown);
    }

    // Non-positive periods are rejected
    {
        std::vector<double> prices(30, 100.0);
        bool thrown = false;
        try {
            TechnicalIndicators::calculateSMA(prices, 0);
        } catch (const InvalidParameterError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // MACD: fast must be shorter than slow
    {
        std::vector<double> prices(60, 100.0);
        bool thrown = false;
        try {
            TechnicalIndicators::calculateMACD(prices, 26, 12, 9);
        } catch (const InvalidParameterError&) {
            thrown = true;
        }
        assert(thrown);

        auto flat = TechnicalIndicators::calculateMACD(prices, 12, 26, 9);
        assert(near(flat.macd, 0.0));
        assert(near(flat.histogram, 0.0));
    }

    // MACD: rising series gives positive MACD; minimum length is slow + signal
    {
        std::vector<double> prices;
        for (int i = 0; i < 35; ++i) prices.push_back(100.0 + i * 0.5);
        auto macd = TechnicalIndicators::calculateMACD(prices, 12, 26, 9);
        assert(macd.macd > 0.0);
        assert(near(macd.histogram, macd.macd - macd.signal));

        prices.pop_back();
        bool thrown = false;
        try {
            TechnicalIndicators::calculateMACD(prices, 12, 26, 9);
        } catch (const InsufficientDataError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // EMA/SMA on constant input
    {
        std::vector<double> prices(25, 42.0);
        assert(near(TechnicalIndicators::calculateEMA(prices, 10), 42.0));
        assert(near(TechnicalIndicators::calculateSMA(prices, 10), 42.0));
        assert(TechnicalIndicators::calculateEMAVector(prices, 10).size() == 16);
    }

    // Volatility: constant prices -> 0, alternating returns -> known stddev
    {
        std::vector<double> flat(21, 50.0);
        assert(near(TechnicalIndicators::calculateVolatility(flat, 20), 0.0));

        std::vector<double> alternating = {100.0, 110.0, 99.0, 108.9};
        // returns: +0.1, -0.1, +0.1 -> population stddev sqrt(8/900)
        double vol = TechnicalIndicators::calculateVolatility(alternating, 3);
        assert(near(vol, std::sqrt(0.04 * 2.0 / 9.0), 1e-9));

        std::vector<double> bad = {0.0, 1.0, 2.0};
        bool thrown = false;
        try {
            TechnicalIndicators::calculateVolatility(bad, 2);
        } catch (const ComputationError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // MFI: no money flow -> 50, only positive flow -> 100
    {
        auto flat = flatCandles(20, 100.0, 500.0);
        assert(TechnicalIndicators::calculateMFI(flat, 14) == 50.0);

        std::vector<Candle> rising;
        for (int i = 0; i < 16; ++i) {
            double p = 100.0 + i;
            rising.emplace_back("TEST", p, p + 1, p - 1, p, 1000.0, i * 60000LL);
        }
        assert(TechnicalIndicators::calculateMFI(rising, 14) == 100.0);

        auto wavy = wavyCandles(40);
        double mfi = TechnicalIndicators::calculateMFI(wavy, 14);
        assert(mfi >= 0.0 && mfi <= 100.0);
    }

    // VWAP: volume weighting, and the zero-volume fallback
    {
        std::vector<Candle> candles;
        candles.emplace_back("TEST", 10, 10, 10, 10, 1.0, 0);
        candles.emplace_back("TEST", 20, 20, 20, 20, 3.0, 60000);
        assert(near(TechnicalIndicators::calculateVWAP(candles, 2), (10.0 + 60.0) / 4.0));

        auto empty_volume = flatCandles(5, 30.0, 0.0);
        assert(near(TechnicalIndicators::calculateVWAP(empty_volume, 5), 30.0));
    }

    // Stochastic: bounds, and zero range -> 50
    {
        auto wavy = wavyCandles(40);
        auto stoch = TechnicalIndicators::calculateStochastic(wavy, 14, 3, 3);
        assert(stoch.percent_k >= 0.0 && stoch.percent_k <= 100.0);
        assert(stoch.percent_d >= 0.0 && stoch.percent_d <= 100.0);

        auto flat = flatCandles(20, 10.0, 1.0);
        auto flat_stoch = TechnicalIndicators::calculateStochastic(flat, 14, 3, 3);
        assert(near(flat_stoch.percent_k, 50.0));
        assert(near(flat_stoch.percent_d, 50.0));
    }

    // ADX needs two periods of bars
    {
        auto wavy = wavyCandles(28);
        auto adx = TechnicalIndicators::calculateADX(wavy, 14);
        assert(adx.adx >= 0.0 && adx.adx <= 100.0);
        assert(adx.plus_di >= 0.0 && adx.minus_di >= 0.0);

        wavy.pop_back();
        bool thrown = false;
        try {
            TechnicalIndicators::calculateADX(wavy, 14);
        } catch (const InsufficientDataError& e) {
            thrown = true;
            assert(e.required() == 28);
        }
        assert(thrown);
    }

    // ATR of constant-range bars equals that range
    {
        std::vector<Candle> candles;
        for (int i = 0; i < 20; ++i) {
            candles.emplace_back("TEST", 100, 102, 98, 100, 1.0, i * 60000LL);
        }
        assert(near(TechnicalIndicators::calculateATR(candles, 14), 4.0));
    }

    // Bollinger bands collapse on constant input and straddle the mean otherwise
    {
        std::vector<double> flat(20, 7.0);
        auto bands = TechnicalIndicators::calculateBollingerBands(flat, 20, 2.0);
        assert(near(bands.upper, 7.0) && near(bands.middle, 7.0) && near(bands.lower, 7.0));

        auto closes = TechnicalIndicators::extractClosePrices(wavyCandles(30));
        auto wide = TechnicalIndicators::calculateBollingerBands(closes, 20, 2.0);
        assert(wide.upper > wide.middle && wide.middle > wide.lower);
    }

    // Williams %R / CCI guards
    {
        auto flat = flatCandles(20, 10.0, 1.0);
        assert(TechnicalIndicators::calculateWilliamsR(flat, 14) == -50.0);
        assert(TechnicalIndicators::calculateCCI(flat, 14) == 0.0);

        auto wavy = wavyCandles(30);
        double wr = TechnicalIndicators::calculateWilliamsR(wavy, 14);
        assert(wr >= -100.0 && wr <= 0.0);
    }

    // OBV seeded with the first bar's volume
    {
        std::vector<Candle> candles;
        candles.emplace_back("TEST", 1, 1, 1, 1, 10.0, 0);
        candles.emplace_back("TEST", 2, 2, 2, 2, 5.0, 60000);
        candles.emplace_back("TEST", 1, 1, 1, 1, 3.0, 120000);
        assert(near(TechnicalIndicators::calculateOBV(candles), 12.0));

        std::vector<Candle> single(candles.begin(), candles.begin() + 1);
        bool thrown = false;
        try {
            TechnicalIndicators::calculateOBV(single);
        } catch (const InsufficientDataError&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}

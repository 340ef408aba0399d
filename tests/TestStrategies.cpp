#include "strategy/RSIStrategy.h"
#include "strategy/MACDStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/MFIStrategy.h"
#include "strategy/VWAPStrategy.h"
#include "strategy/StrategyManager.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

using namespace quantcore;
using namespace quantcore::strategy;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Indicator service returning fixed values
class FixedIndicators : public analytics::IndicatorService {
public:
    double rsi = 50.0;
    double volatility = 0.01;
    double mfi = 50.0;
    double vwap = 100.0;
    analytics::MACDResult macd;
    bool fail = false;

    double calculateRSI(const std::string&, const std::vector<Candle>&, int) override {
        check();
        return rsi;
    }
    analytics::MACDResult calculateMACD(const std::string&, const std::vector<Candle>&, int, int, int) override {
        check();
        return macd;
    }
    double calculateVolatility(const std::string&, const std::vector<Candle>&, int) override {
        check();
        return volatility;
    }
    double calculateMFI(const std::string&, const std::vector<Candle>&, int) override {
        check();
        return mfi;
    }
    double calculateVWAP(const std::string&, const std::vector<Candle>&, int) override {
        check();
        return vwap;
    }

private:
    void check() const {
        if (fail) throw ComputationError("indicator unavailable");
    }
};

// Strategy whose evaluation throws something that is not a std::exception
class ThrowingStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override {
        return StrategyInfo("throwing", "Throwing", "throws a non-standard value");
    }

protected:
    Signal evaluate(const MarketData&, const std::vector<MarketData>&) override {
        throw 42;
    }
};

Candle bar(double open, double close, double volume, Timestamp ts = 1700000060000LL) {
    double high = std::max(open, close) * 1.001;
    double low = std::min(open, close) * 0.999;
    return Candle("BTCUSDT", open, high, low, close, volume, ts);
}

std::vector<Candle> history(size_t count, double price, double volume) {
    std::vector<Candle> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(bar(price, price, volume, 1700000000000LL - static_cast<Timestamp>(count - i) * 60000));
    }
    return out;
}

}

int main() {
    Logger::getInstance().initializeConsoleOnly("warn");
    auto indicators = std::make_shared<FixedIndicators>();

    // Momentum: +3% bar with calm volatility
    {
        MomentumStrategy momentum(MomentumStrategyConfig(), indicators);
        indicators->volatility = 0.01;

        Candle current = bar(50000.0, 51500.0, 200000.0);
        Signal s = momentum.analyze(current, history(30, 50000.0, 150000.0));
        assert(s.action == SignalAction::BUY);
        assert(near(s.confidence, 0.6));
        assert(s.symbol == "BTCUSDT");
        assert(s.strategy_name == "Momentum");
        assert(s.timestamp == current.timestamp);
        assert(s.entry_price == 51500.0);
        assert(s.stop_loss && near(*s.stop_loss, 51500.0 * 0.98));
        assert(s.take_profit && near(*s.take_profit, 51500.0 * 1.05));
        assert(contains(s.reason, "+3.00%"));
        assert(contains(s.reason, "STRONG UPWARD"));
    }

    // Momentum: high volatility is filtered before direction
    {
        MomentumStrategy momentum(MomentumStrategyConfig(), indicators);
        indicators->volatility = 0.2;
        Signal s = momentum.analyze(bar(50000.0, 51500.0, 200000.0), history(30, 50000.0, 150000.0));
        assert(s.action == SignalAction::HOLD);
        assert(near(s.confidence, 0.3));
        assert(contains(s.reason, "FILTERED"));
        assert(!s.stop_loss && !s.take_profit);
        indicators->volatility = 0.01;
    }

    // Momentum: -4% bar on thin volume
    {
        MomentumStrategy momentum(MomentumStrategyConfig(), indicators);
        Signal s = momentum.analyze(bar(100.0, 96.0, 1000.0), history(30, 100.0, 1000.0));
        assert(s.action == SignalAction::SELL);
        assert(near(s.confidence, 0.8 * 0.7));
        assert(contains(s.reason, "[Low Volume: 1000]"));
        assert(near(*s.stop_loss, 96.0 * 1.02));
        assert(near(*s.take_profit, 96.0 * 0.95));
    }

    // RSI thresholds
    {
        RSIStrategy rsi(RSIStrategyConfig(), indicators);
        auto bars = history(30, 100.0, 1000.0);

        indicators->rsi = 20.0;
        Signal buy = rsi.analyze(bar(100.0, 100.0, 1000.0), bars);
        assert(buy.action == SignalAction::BUY);
        assert(near(buy.confidence, 10.0 / 30.0));
        assert(near(*buy.stop_loss, 97.0) && near(*buy.take_profit, 106.0));
        assert(contains(buy.reason, "OVERSOLD"));

        indicators->rsi = 85.0;
        Signal sell = rsi.analyze(bar(100.0, 100.0, 1000.0), bars);
        assert(sell.action == SignalAction::SELL);
        assert(near(sell.confidence, 0.5));
        assert(near(*sell.stop_loss, 103.0) && near(*sell.take_profit, 94.0));

        indicators->rsi = 1.0;
        assert(near(rsi.analyze(bar(100.0, 100.0, 1000.0), bars).confidence, 0.9));

        indicators->rsi = 50.0;
        Signal hold = rsi.analyze(bar(100.0, 100.0, 1000.0), bars);
        assert(hold.action == SignalAction::HOLD);
        assert(near(hold.confidence, 0.4));
    }

    // MACD histogram and volume penalty
    {
        MACDStrategy macd(MACDStrategyConfig(), indicators);
        auto bars = history(40, 100.0, 200000.0);

        indicators->macd = analytics::MACDResult(1.2, 0.7, 0.5);
        Signal buy = macd.analyze(bar(100.0, 100.0, 200000.0), bars);
        assert(buy.action == SignalAction::BUY);
        assert(near(buy.confidence, 0.5));
        assert(contains(buy.reason, "BULLISH CROSSOVER"));

        indicators->macd = analytics::MACDResult(-1.0, 1.0, -2.0);
        Signal sell = macd.analyze(bar(100.0, 100.0, 200000.0), bars);
        assert(sell.action == SignalAction::SELL);
        assert(near(sell.confidence, 0.95));

        Signal thin = macd.analyze(bar(100.0, 100.0, 5000.0), bars);
        assert(near(thin.confidence, 0.95 * 0.7));
        assert(contains(thin.reason, "[Low Volume: 5000]"));

        indicators->macd = analytics::MACDResult(0.0, 0.0, 0.0);
        assert(macd.analyze(bar(100.0, 100.0, 200000.0), bars).action == SignalAction::HOLD);
    }

    // MFI extremes
    {
        MFIStrategy mfi(MFIStrategyConfig(), indicators);
        auto bars = history(30, 100.0, 80000.0);

        indicators->mfi = 15.0;
        Signal buy = mfi.analyze(bar(100.0, 100.0, 80000.0), bars);
        assert(buy.action == SignalAction::BUY);
        assert(near(buy.confidence, 0.5));
        assert(near(*buy.stop_loss, 97.0));
        assert(near(*buy.take_profit, 106.0));
        assert(contains(buy.reason, "OVERSOLD"));

        indicators->mfi = 98.0;
        Signal sell = mfi.analyze(bar(100.0, 100.0, 80000.0), bars);
        assert(sell.action == SignalAction::SELL);
        assert(near(sell.confidence, 0.9));

        Signal thin = mfi.analyze(bar(100.0, 100.0, 100.0), bars);
        assert(near(thin.confidence, 0.9 * 0.8));
        indicators->mfi = 50.0;
    }

    // VWAP deviation bands
    {
        VWAPStrategyConfig config;
        config.use_volume_confirmation = false;
        VWAPStrategy vwap(config, indicators);
        auto bars = history(30, 100.0, 1000.0);

        indicators->vwap = 100.0;
        Signal buy = vwap.analyze(bar(97.0, 97.0, 1000.0), bars);
        assert(buy.action == SignalAction::BUY);
        assert(near(buy.confidence, 0.9));
        assert(near(*buy.stop_loss, 97.0 * 0.97));
        assert(near(*buy.take_profit, 100.0 * 1.005));

        Signal sell = vwap.analyze(bar(103.0, 103.0, 1000.0), bars);
        assert(sell.action == SignalAction::SELL);
        assert(near(*sell.take_profit, 100.0 * 0.995));

        assert(vwap.analyze(bar(100.5, 100.5, 1000.0), bars).action == SignalAction::HOLD);
    }

    // Any evaluation failure becomes HOLD with zero confidence
    {
        RSIStrategy rsi(RSIStrategyConfig(), indicators);
        indicators->fail = true;
        Candle current = bar(100.0, 100.0, 1000.0);
        Signal s = rsi.analyze(current, history(30, 100.0, 1000.0));
        assert(s.action == SignalAction::HOLD);
        assert(s.confidence == 0.0);
        assert(s.reason.rfind("Error: ", 0) == 0);
        assert(s.timestamp == current.timestamp);
        indicators->fail = false;
    }

    // Non-standard exceptions are caught too
    {
        ThrowingStrategy throwing;
        Candle current = bar(100.0, 100.0, 1000.0);
        Signal s = throwing.analyze(current, history(5, 100.0, 1000.0));
        assert(s.action == SignalAction::HOLD);
        assert(s.confidence == 0.0);
        assert(s.reason == "Error: unknown");
        assert(s.strategy_name == "Throwing");
    }

    // Real indicators with too little history also degrade to HOLD
    {
        auto service = std::make_shared<analytics::IndicatorService>();
        MACDStrategy macd(MACDStrategyConfig(), service);
        Signal s = macd.analyze(bar(100.0, 100.0, 200000.0), history(5, 100.0, 200000.0));
        assert(s.action == SignalAction::HOLD);
        assert(s.confidence == 0.0);
        assert(contains(s.reason, "Insufficient data"));
    }

    // Manager: registry, loading and best-signal selection
    {
        Config::getInstance().reset();
        StrategyManager manager(indicators);

        auto names = manager.getAvailableStrategies();
        assert(names.size() == 5);

        bool thrown = false;
        try {
            manager.createStrategy("grid");
        } catch (const InvalidParameterError&) {
            thrown = true;
        }
        assert(thrown);

        assert(manager.loadStrategies({"rsi", "unknown", "MFI", "momentum"}) == 3);
        assert(manager.getStrategies().size() == 3);
        assert(manager.getStrategy("mfi") != nullptr);
        assert(manager.getStrategy("vwap") == nullptr);

        indicators->rsi = 20.0;       // BUY 0.333
        indicators->mfi = 95.0;       // SELL 0.75
        indicators->volatility = 0.01;
        auto signals = manager.collectSignals(bar(100.0, 100.5, 200000.0), history(30, 100.0, 200000.0));
        assert(signals.size() == 3);

        Signal best = StrategyManager::selectBestSignal(signals);
        assert(best.action == SignalAction::SELL);
        assert(best.strategy_name == "MFI");
        assert(near(best.confidence, 0.75));

        indicators->rsi = 50.0;
        indicators->mfi = 50.0;
        auto quiet = manager.collectSignals(bar(100.0, 100.5, 200000.0), history(30, 100.0, 200000.0));
        Signal none = StrategyManager::selectBestSignal(quiet);
        assert(none.action == SignalAction::HOLD);
        assert(none.symbol == "BTCUSDT");
        assert(none.reason == "No actionable signal");

        assert(StrategyManager::selectBestSignal({}).action == SignalAction::HOLD);
    }

    std::cout << "[TEST] Strategies PASSED\n";
    return 0;
}

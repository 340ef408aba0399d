#pragma once

namespace quantcore {
namespace strategy {

struct RSIStrategyConfig {
    int period = 14;
    double oversold_threshold = 30.0;     // Buy trigger
    double overbought_threshold = 70.0;   // Sell trigger
};

struct MACDStrategyConfig {
    int fast_period = 12;
    int slow_period = 26;
    int signal_period = 9;

    // Histogram thresholds
    double buy_threshold = 0.0001;
    double sell_threshold = -0.0001;

    double min_volume_threshold = 100000.0;
};

struct MomentumStrategyConfig {
    // Bar change in percent units (2.0 == +2%)
    double buy_threshold = 2.0;
    double sell_threshold = -2.0;

    // Max tolerated volatility before forcing Hold
    double volatility_filter = 0.15;
    int volatility_period = 20;

    double min_volume_threshold = 100000.0;
};

struct MFIStrategyConfig {
    int period = 14;
    double oversold_threshold = 20.0;
    double overbought_threshold = 80.0;
    // Lower than the others since MFI already weighs volume
    double min_volume_threshold = 50000.0;
};

struct VWAPStrategyConfig {
    int period = 20;
    // Deviation from VWAP in percent units
    double buy_deviation_threshold = -2.0;
    double sell_deviation_threshold = 2.0;
    bool use_volume_confirmation = true;
};

} // namespace strategy
} // namespace quantcore

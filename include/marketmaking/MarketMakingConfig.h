#pragma once

#include <string>

namespace quantcore {
namespace marketmaking {

// Raw market-making settings as loaded from config. Turned into validated
// ASParameters by ASParameters::fromConfig.
struct MarketMakingConfig {
    std::string preset = "conservative";   // conservative | aggressive | custom

    double gamma = 0.1;
    double kappa = 1.5;
    double sigma = 0.5;
    double horizon = 1.0;
    double max_inventory = 1.0;
    double target_inventory = 0.0;
    double min_spread_bps = 10.0;
    double max_spread_bps = 50.0;

    int order_book_levels = 5;
};

} // namespace marketmaking
} // namespace quantcore

#pragma once

#include "marketmaking/MarketMakingConfig.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quantcore {
namespace marketmaking {

// Avellaneda-Stoikov quoting parameters. Build through create() or a preset;
// a constructed instance always satisfies validate().
struct ASParameters {
    double gamma;               // risk aversion, (0, 10]
    double kappa;               // order arrival liquidity, (0, 100]
    double sigma;               // volatility as a fraction of price, (0, 5]
    double T;                   // remaining horizon, 1.0 at session start -> 0.0, [0, 1]
    double max_inventory;       // > 0
    double target_inventory;
    double min_spread_bps;      // >= 0
    double max_spread_bps;      // > min_spread_bps

    // Every violated constraint, empty when valid
    std::vector<std::string> validate() const;
    bool isValid() const { return validate().empty(); }

    // Throws InvalidParameterError listing every violation
    static ASParameters create(double gamma, double kappa, double sigma, double T,
                               double max_inventory, double target_inventory = 0.0,
                               double min_spread_bps = 5.0, double max_spread_bps = 100.0);

    static ASParameters conservative(double max_inventory = 1.0);
    static ASParameters aggressive(double max_inventory = 1.0);

    // "conservative" / "aggressive" presets keep the configured max and
    // target inventory; anything else uses the explicit fields.
    static ASParameters fromConfig(const MarketMakingConfig& config);
    static ASParameters fromJson(const nlohmann::json& j);

    // Same parameters with a different remaining horizon
    ASParameters withHorizon(double remaining) const;

    nlohmann::json toJson() const;
    std::string toString() const;

private:
    ASParameters() = default;
};

} // namespace marketmaking
} // namespace quantcore

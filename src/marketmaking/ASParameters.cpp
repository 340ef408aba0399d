#include "marketmaking/ASParameters.h"
#include "common/Errors.h"
#include <iomanip>
#include <sstream>

namespace quantcore {
namespace marketmaking {

namespace {
std::string num(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}
}

std::vector<std::string> ASParameters::validate() const {
    std::vector<std::string> errors;

    if (!(gamma > 0.0 && gamma <= 10.0)) {
        errors.push_back("Gamma must be between 0 and 10.0 (got " + num(gamma) + ")");
    }
    if (!(kappa > 0.0 && kappa <= 100.0)) {
        errors.push_back("Kappa must be between 0 and 100.0 (got " + num(kappa) + ")");
    }
    if (!(sigma > 0.0 && sigma <= 5.0)) {
        errors.push_back("Sigma must be between 0 and 5.0 (got " + num(sigma) + ")");
    }
    if (!(T >= 0.0 && T <= 1.0)) {
        errors.push_back("T must be between 0.0 and 1.0 (got " + num(T) + ")");
    }
    if (!(max_inventory > 0.0)) {
        errors.push_back("MaxInventory must be positive (got " + num(max_inventory) + ")");
    }
    if (!(min_spread_bps >= 0.0)) {
        errors.push_back("MinSpreadBps must be non-negative (got " + num(min_spread_bps) + ")");
    }
    if (!(max_spread_bps > min_spread_bps)) {
        errors.push_back("MaxSpreadBps (" + num(max_spread_bps) + ") must be greater than MinSpreadBps (" +
                         num(min_spread_bps) + ")");
    }

    return errors;
}

ASParameters ASParameters::create(double gamma, double kappa, double sigma, double T,
                                  double max_inventory, double target_inventory,
                                  double min_spread_bps, double max_spread_bps) {
    ASParameters params;
    params.gamma = gamma;
    params.kappa = kappa;
    params.sigma = sigma;
    params.T = T;
    params.max_inventory = max_inventory;
    params.target_inventory = target_inventory;
    params.min_spread_bps = min_spread_bps;
    params.max_spread_bps = max_spread_bps;

    auto errors = params.validate();
    if (!errors.empty()) {
        throw InvalidParameterError(std::move(errors));
    }
    return params;
}

ASParameters ASParameters::conservative(double max_inventory) {
    return create(0.1, 1.5, 0.5, 1.0, max_inventory, 0.0, 10.0, 50.0);
}

ASParameters ASParameters::aggressive(double max_inventory) {
    return create(0.01, 5.0, 0.3, 1.0, max_inventory, 0.0, 2.0, 20.0);
}

ASParameters ASParameters::fromConfig(const MarketMakingConfig& config) {
    if (config.preset == "conservative" || config.preset == "aggressive") {
        ASParameters preset = (config.preset == "conservative")
            ? conservative(config.max_inventory)
            : aggressive(config.max_inventory);
        return create(preset.gamma, preset.kappa, preset.sigma, config.horizon,
                      preset.max_inventory, config.target_inventory,
                      preset.min_spread_bps, preset.max_spread_bps);
    }

    return create(config.gamma, config.kappa, config.sigma, config.horizon,
                  config.max_inventory, config.target_inventory,
                  config.min_spread_bps, config.max_spread_bps);
}

ASParameters ASParameters::fromJson(const nlohmann::json& j) {
    return create(j.at("gamma").get<double>(),
                  j.at("kappa").get<double>(),
                  j.at("sigma").get<double>(),
                  j.at("T").get<double>(),
                  j.at("max_inventory").get<double>(),
                  j.value("target_inventory", 0.0),
                  j.value("min_spread_bps", 5.0),
                  j.value("max_spread_bps", 100.0));
}

ASParameters ASParameters::withHorizon(double remaining) const {
    return create(gamma, kappa, sigma, remaining, max_inventory, target_inventory,
                  min_spread_bps, max_spread_bps);
}

nlohmann::json ASParameters::toJson() const {
    return {
        {"gamma", gamma},
        {"kappa", kappa},
        {"sigma", sigma},
        {"T", T},
        {"max_inventory", max_inventory},
        {"target_inventory", target_inventory},
        {"min_spread_bps", min_spread_bps},
        {"max_spread_bps", max_spread_bps}
    };
}

std::string ASParameters::toString() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4)
       << "ASParameters(gamma=" << gamma
       << ", kappa=" << kappa
       << ", sigma=" << sigma
       << ", T=" << T
       << ", max_inv=" << max_inventory
       << ", target=" << target_inventory
       << std::setprecision(1)
       << ", spread=[" << min_spread_bps << ", " << max_spread_bps << "] bps)";
    return ss.str();
}

} // namespace marketmaking
} // namespace quantcore

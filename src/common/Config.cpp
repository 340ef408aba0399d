#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace quantcore {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(name);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig();
    rsi_config_ = strategy::RSIStrategyConfig();
    macd_config_ = strategy::MACDStrategyConfig();
    momentum_config_ = strategy::MomentumStrategyConfig();
    mfi_config_ = strategy::MFIStrategyConfig();
    vwap_config_ = strategy::VWAPStrategyConfig();
    market_making_config_ = marketmaking::MarketMakingConfig();
}

void Config::setEnabledStrategies(const std::vector<std::string>& v) {
    engine_config_.enabled_strategies.clear();
    for (const auto& name : v) {
        engine_config_.enabled_strategies.push_back(normalizeName(name));
    }
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        applyJson(j);

        std::cout << "Config loaded: cache TTL=" << engine_config_.indicator_cache_ttl_seconds
                  << "s, strategies=" << engine_config_.enabled_strategies.size() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("engine")) {
        auto& e = j["engine"];
        engine_config_.log_level = e.value("log_level", "info");
        engine_config_.log_dir = e.value("log_dir", "logs");

        int ttl = e.value("indicator_cache_ttl_seconds", 60);
        if (ttl < 1 || ttl > 3600) {
            std::cout << "Warning: indicator_cache_ttl_seconds out of range (" << ttl
                      << "), keeping " << engine_config_.indicator_cache_ttl_seconds << std::endl;
        } else {
            engine_config_.indicator_cache_ttl_seconds = ttl;
        }

        int bucket = e.value("indicator_time_bucket_seconds", 60);
        if (bucket > 0) {
            engine_config_.indicator_time_bucket_seconds = bucket;
        }

        if (e.contains("enabled_strategies")) {
            setEnabledStrategies(e["enabled_strategies"].get<std::vector<std::string>>());
        }
    }

    if (j.contains("strategies")) {
        auto& strategies = j["strategies"];

        if (strategies.contains("rsi")) {
            auto& s = strategies["rsi"];
            rsi_config_.period = s.value("period", 14);
            rsi_config_.oversold_threshold = s.value("oversold_threshold", 30.0);
            rsi_config_.overbought_threshold = s.value("overbought_threshold", 70.0);
        }

        if (strategies.contains("macd")) {
            auto& s = strategies["macd"];
            macd_config_.fast_period = s.value("fast_period", 12);
            macd_config_.slow_period = s.value("slow_period", 26);
            macd_config_.signal_period = s.value("signal_period", 9);
            macd_config_.buy_threshold = s.value("buy_threshold", 0.0001);
            macd_config_.sell_threshold = s.value("sell_threshold", -0.0001);
            macd_config_.min_volume_threshold = s.value("min_volume_threshold", 100000.0);
        }

        if (strategies.contains("momentum")) {
            auto& s = strategies["momentum"];
            momentum_config_.buy_threshold = s.value("buy_threshold", 2.0);
            momentum_config_.sell_threshold = s.value("sell_threshold", -2.0);
            momentum_config_.volatility_filter = s.value("volatility_filter", 0.15);
            momentum_config_.volatility_period = s.value("volatility_period", 20);
            momentum_config_.min_volume_threshold = s.value("min_volume_threshold", 100000.0);
        }

        if (strategies.contains("mfi")) {
            auto& s = strategies["mfi"];
            mfi_config_.period = s.value("period", 14);
            mfi_config_.oversold_threshold = s.value("oversold_threshold", 20.0);
            mfi_config_.overbought_threshold = s.value("overbought_threshold", 80.0);
            mfi_config_.min_volume_threshold = s.value("min_volume_threshold", 50000.0);
        }

        if (strategies.contains("vwap")) {
            auto& s = strategies["vwap"];
            vwap_config_.period = s.value("period", 20);
            vwap_config_.buy_deviation_threshold = s.value("buy_deviation_threshold", -2.0);
            vwap_config_.sell_deviation_threshold = s.value("sell_deviation_threshold", 2.0);
            vwap_config_.use_volume_confirmation = s.value("use_volume_confirmation", true);
        }
    }

    if (j.contains("market_making")) {
        auto& m = j["market_making"];
        auto& mm = market_making_config_;
        mm.preset = normalizeName(m.value("preset", std::string("conservative")));
        mm.gamma = m.value("gamma", mm.gamma);
        mm.kappa = m.value("kappa", mm.kappa);
        mm.sigma = m.value("sigma", mm.sigma);
        mm.horizon = m.value("horizon", mm.horizon);
        mm.max_inventory = m.value("max_inventory", mm.max_inventory);
        mm.target_inventory = m.value("target_inventory", mm.target_inventory);
        mm.min_spread_bps = m.value("min_spread_bps", mm.min_spread_bps);
        mm.max_spread_bps = m.value("max_spread_bps", mm.max_spread_bps);
        mm.order_book_levels = m.value("order_book_levels", mm.order_book_levels);
    }
}

} // namespace quantcore

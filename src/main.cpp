#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "analytics/IndicatorService.h"
#include "analytics/OrderBook.h"
#include "strategy/StrategyManager.h"
#include "marketmaking/QuoteManager.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace quantcore;

namespace {

void printUsage() {
    std::cout << "Usage: quantcore_engine [--config <path>] [--candles <file.json>]\n"
              << "                        [--orderbook <file.json>] [--inventory <qty>]\n"
              << "                        [--strategies rsi,macd,...]\n\n"
              << "  --candles    JSON array of {symbol, timestamp, open, high, low, close, volume}, oldest first\n"
              << "  --orderbook  JSON {symbol, exchange, timestamp, bids: [[price, qty], ...], asks: [...]}\n"
              << "Without input files a synthetic series is generated.\n";
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

std::vector<Candle> loadCandles(const std::string& path) {
    auto j = readJsonFile(path);
    if (!j.is_array()) {
        throw InvalidParameterError("candle file must hold a JSON array");
    }

    std::vector<Candle> candles;
    candles.reserve(j.size());
    for (const auto& c : j) {
        candles.emplace_back(c.value("symbol", std::string("UNKNOWN")),
                             c.at("open").get<double>(),
                             c.at("high").get<double>(),
                             c.at("low").get<double>(),
                             c.at("close").get<double>(),
                             c.value("volume", 0.0),
                             c.at("timestamp").get<long long>());
    }
    return candles;
}

// Random-walk 1-minute bars with slowly changing drift
std::vector<Candle> generateCandles(const std::string& symbol, int candle_count, double start_price) {
    std::mt19937 rng(42);
    std::normal_distribution<double> price_change(0.0, 0.002);
    std::uniform_real_distribution<double> volume_dist(50000.0, 250000.0);
    std::uniform_real_distribution<double> wick_dist(0.001, 0.004);
    std::uniform_real_distribution<double> trend_dist(-0.0003, 0.0005);

    double trend_bias = trend_dist(rng);
    int trend_duration = 0;
    int trend_max = 20 + static_cast<int>(rng() % 40);

    double price = start_price;
    Timestamp timestamp = nowMillis() - static_cast<Timestamp>(candle_count) * 60000;

    std::vector<Candle> candles;
    candles.reserve(candle_count);
    for (int i = 0; i < candle_count; ++i) {
        if (++trend_duration > trend_max) {
            trend_bias = trend_dist(rng);
            trend_max = 20 + static_cast<int>(rng() % 40);
            trend_duration = 0;
        }

        const double change = price_change(rng) + trend_bias;
        const double open = price;
        const double close = open * (1.0 + change);
        const double high = std::max(open, close) + open * wick_dist(rng);
        const double low = std::min(open, close) - open * wick_dist(rng);
        const double volume = volume_dist(rng) * (1.0 + std::abs(change) * 50.0);

        candles.emplace_back(symbol, open, high, low, close, volume, timestamp);
        price = close;
        timestamp += 60000;
    }
    return candles;
}

analytics::OrderBookSnapshot syntheticBook(const Candle& last) {
    analytics::OrderBookSnapshot book;
    book.symbol = last.symbol;
    book.exchange = "synthetic";
    book.timestamp = last.timestamp + 1;

    const double tick = last.close * 0.0001;
    for (int i = 0; i < 5; ++i) {
        book.bids.emplace_back(last.close - tick * (i + 1), 0.5 + 0.25 * i);
        book.asks.emplace_back(last.close + tick * (i + 1), 0.4 + 0.3 * i);
    }
    return book;
}

std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos) ? csv.substr(start) : csv.substr(start, comma - start);
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::string candles_path;
    std::string orderbook_path;
    std::vector<std::string> cli_strategies;
    std::string inventory_arg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            printUsage();
            return 1;
        }
        if (arg == "--config") config_path = argv[++i];
        else if (arg == "--candles") candles_path = argv[++i];
        else if (arg == "--orderbook") orderbook_path = argv[++i];
        else if (arg == "--inventory") inventory_arg = argv[++i];
        else if (arg == "--strategies") cli_strategies = splitCsv(argv[++i]);
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    try {
        const double inventory = inventory_arg.empty() ? 0.0 : std::stod(inventory_arg);

        auto& config = Config::getInstance();
        config.load(config_path);
        if (!cli_strategies.empty()) {
            config.setEnabledStrategies(cli_strategies);
        }

        const auto engine_config = config.getEngineConfig();
        Logger::getInstance().initialize(engine_config.log_dir, engine_config.log_level);

        LOG_INFO("=============================================");
        LOG_INFO("       quantcore decision engine");
        LOG_INFO("=============================================");

        std::vector<Candle> candles = candles_path.empty()
            ? generateCandles("BTCUSDT", 120, 50000.0)
            : loadCandles(candles_path);
        if (candles.empty()) {
            throw InvalidParameterError("no candles to analyze");
        }
        if (!validateSeries(candles)) {
            LOG_WARN("Candle series has malformed bars or non-increasing timestamps");
        }

        // Strategies
        auto indicators = std::make_shared<analytics::IndicatorService>(engine_config);
        strategy::StrategyManager manager(indicators);
        manager.loadStrategies(engine_config.enabled_strategies);

        const Candle current = candles.back();
        std::vector<Candle> history(candles.begin(), candles.end() - 1);

        auto signals = manager.collectSignals(current, history);
        for (const auto& s : signals) {
            Logger::getInstance().logSignal(s.symbol, s.strategy_name, strategy::toString(s.action),
                                            s.confidence, s.entry_price,
                                            s.stop_loss.value_or(0.0), s.take_profit.value_or(0.0));
            LOG_INFO("[{}] {} conf {:.2f} - {}", s.strategy_name, strategy::toString(s.action),
                     s.confidence, s.reason);
        }

        auto best = strategy::StrategyManager::selectBestSignal(signals);
        LOG_INFO("Best signal: {} {} (conf {:.2f})", best.symbol, strategy::toString(best.action), best.confidence);

        // Market making
        const auto mm_config = config.getMarketMakingConfig();
        auto params = marketmaking::ASParameters::fromConfig(mm_config);
        marketmaking::QuoteManager quotes(params, mm_config.order_book_levels);

        analytics::OrderBookSnapshot book = orderbook_path.empty()
            ? syntheticBook(current)
            : analytics::OrderBookSnapshot::fromJson(readJsonFile(orderbook_path));

        if (inventory != 0.0) {
            quotes.onFill(book.symbol, inventory, book.midPrice(), book.timestamp);
        }

        auto quote = quotes.onOrderBook(book);
        if (quote) {
            LOG_INFO("Quote: {}", quote->toString());
            if (!quote->validateForExecution(params.min_spread_bps, params.max_spread_bps)) {
                LOG_WARN("Quote failed execution checks");
            }
        }

        marketmaking::MarketContext context;
        std::size_t tail = std::min<std::size_t>(candles.size(), 5);
        context.recent_candles.assign(candles.end() - tail, candles.end());
        std::cout << quotes.features(book.symbol, context).toJson().dump(2) << std::endl;

        return 0;
    } catch (const InvalidParameterError& e) {
        LOG_ERROR("Invalid input: {}", e.what());
        std::cerr << "Invalid input: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
    }
    return 1;
}

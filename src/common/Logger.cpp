#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>

namespace quantcore {

namespace {
spdlog::level::level_enum parseLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str returns off for unknown names
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/quantcore.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(parseLevel(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        signal_logger_ = spdlog::daily_logger_mt("signals", logs_path.string() + "/signals.log");
        signal_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::initializeConsoleOnly(const std::string& level) {
    if (initialized_) return;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    main_logger_ = std::make_shared<spdlog::logger>("main", console_sink);
    main_logger_->set_level(parseLevel(level));
    initialized_ = true;
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(parseLevel(level));
    }
}

void Logger::logSignal(const std::string& symbol, const std::string& strategy,
                       const std::string& action, double confidence,
                       double entry_price, double stop_loss, double take_profit) {
    if (signal_logger_) {
        std::ostringstream oss;
        oss << "signal," << symbol << "," << strategy << "," << action << ","
            << std::fixed << std::setprecision(3) << confidence << ","
            << std::fixed << std::setprecision(8) << entry_price << ","
            << std::fixed << std::setprecision(8) << stop_loss << ","
            << std::fixed << std::setprecision(8) << take_profit;
        signal_logger_->info(oss.str());
    }
}

void Logger::logQuote(const std::string& symbol, double bid, double bid_qty,
                      double ask, double ask_qty, double spread_bps) {
    if (signal_logger_) {
        std::ostringstream oss;
        oss << "quote," << symbol << ","
            << std::fixed << std::setprecision(8) << bid << ","
            << std::fixed << std::setprecision(8) << bid_qty << ","
            << std::fixed << std::setprecision(8) << ask << ","
            << std::fixed << std::setprecision(8) << ask_qty << ","
            << std::fixed << std::setprecision(2) << spread_bps;
        signal_logger_->info(oss.str());
    }
}

} // namespace quantcore

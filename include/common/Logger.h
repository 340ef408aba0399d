#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace quantcore {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    // Console sink only, no files. Used by tests and tools.
    void initializeConsoleOnly(const std::string& level = "info");
    void setLevel(const std::string& level);

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // CSV rows: symbol,strategy,action,confidence,entry,stop,take
    void logSignal(const std::string& symbol, const std::string& strategy,
                   const std::string& action, double confidence,
                   double entry_price, double stop_loss, double take_profit);

    // CSV rows: symbol,bid,bid_qty,ask,ask_qty,spread_bps
    void logQuote(const std::string& symbol, double bid, double bid_qty,
                  double ask, double ask_qty, double spread_bps);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) quantcore::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) quantcore::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) quantcore::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) quantcore::Logger::getInstance().error(__VA_ARGS__)

} // namespace quantcore

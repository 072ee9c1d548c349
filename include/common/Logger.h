#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace tradeguard {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

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

    // Trade journal, one CSV row per fill:
    // position_id,symbol,side,price,quantity,fees,pnl,reason
    void logTrade(const std::string& position_id, const std::string& symbol,
                  const std::string& side, double price, double quantity,
                  double fees, double pnl, const std::string& reason);

    void flush();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tradeguard::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tradeguard::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradeguard::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradeguard::Logger::getInstance().error(__VA_ARGS__)

} // namespace tradeguard

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace exitforge {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

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

    // One CSV row per emitted trigger: id,instrument,kind,pnl_pct,price,hwm_pct
    void logTrigger(const std::string& position_id, const std::string& instrument,
                    const std::string& kind, double pnl_pct, double price, double hwm_pct);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trigger_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) exitforge::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) exitforge::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) exitforge::Logger::getInstance().error(__VA_ARGS__)

} // namespace exitforge

#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <vector>

namespace exitforge {

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
            logs_path.string() + "/exitforge.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trigger_logger_ = spdlog::daily_logger_mt("triggers", logs_path.string() + "/triggers.log");
        trigger_logger_->set_pattern("%v");
        trigger_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logTrigger(const std::string& position_id, const std::string& instrument,
                        const std::string& kind, double pnl_pct, double price, double hwm_pct) {
    if (trigger_logger_) {
        std::ostringstream oss;
        oss << position_id << "," << instrument << "," << kind << ","
            << std::fixed << std::setprecision(4) << pnl_pct << ","
            << std::fixed << std::setprecision(10) << price << ","
            << std::fixed << std::setprecision(4) << hwm_pct;
        trigger_logger_->info(oss.str());
    }
}

} // namespace exitforge

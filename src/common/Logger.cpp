#include "common/Logger.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace tradesense {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

spdlog::logger* Logger::logger() const {
    if (main_logger_) {
        return main_logger_.get();
    }
    return spdlog::default_logger_raw();
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path = std::filesystem::absolute(log_dir);
    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "tradesense.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        decision_logger_ = spdlog::daily_logger_mt("decision", (logs_path / "decisions.log").string());
        decision_logger_->set_pattern("%v");
        decision_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        decision_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

void Logger::logDecision(const std::string& symbol, const std::string& action,
                         double confidence, double strength, double risk_score,
                         const std::string& regime) {
    if (decision_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << action << ","
            << std::fixed << std::setprecision(4) << confidence << ","
            << std::fixed << std::setprecision(4) << strength << ","
            << std::fixed << std::setprecision(4) << risk_score << ","
            << regime;
        decision_logger_->info(oss.str());
    }
}

} // namespace tradesense

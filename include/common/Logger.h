#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace tradesense {

class Logger {
public:
    static Logger& getInstance();

    // Console (stderr) + rotating file sink under log_dir, plus a daily decisions log.
    // Until this is called, messages go to spdlog's default logger.
    void initialize(const std::string& log_dir = "logs",
                    const std::string& level = "info");
    void setLevel(const std::string& level);

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    // symbol,action,confidence,strength,risk_score,regime
    void logDecision(const std::string& symbol, const std::string& action,
                     double confidence, double strength, double risk_score,
                     const std::string& regime);

private:
    Logger() = default;
    spdlog::logger* logger() const;

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> decision_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tradesense::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tradesense::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradesense::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradesense::Logger::getInstance().error(__VA_ARGS__)

} // namespace tradesense

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>
#include <utility>

namespace tradepulse {

class Logger {
public:
    static Logger& getInstance();

    // 초기화 전에는 모든 로그 호출이 무시됨 (호스트가 로거 없이 코어만 쓰는 경우)
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

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

    // One CSV row per fired signal: pair,timestamp,kind,close
    void logSignal(const std::string& pair, long long timestamp,
                   const std::string& kind, double close);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tradepulse::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tradepulse::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradepulse::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradepulse::Logger::getInstance().error(__VA_ARGS__)

} // namespace tradepulse

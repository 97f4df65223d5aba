#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

#include "common/Types.h"

namespace stratsim {

struct LoggingConfig {
    std::string level = "info";
    std::string log_dir;          // 비어 있으면 파일 싱크 없음
    bool console = true;
};

// Handed to every component that logs. Nothing in the library reaches for a global logger.
class Logger {
public:
    Logger(std::shared_ptr<spdlog::logger> main_logger,
           std::shared_ptr<spdlog::logger> order_logger = nullptr);

    static std::shared_ptr<Logger> create(const std::string& name, const LoggingConfig& config);
    static std::shared_ptr<Logger> createConsole(const std::string& name);
    static std::shared_ptr<Logger> createNull();

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

    void logOrder(const std::string& symbol, const OrderRecord& order);
    void setLevel(const std::string& level);
    void flush();

private:
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> order_logger_;
};

} // namespace stratsim

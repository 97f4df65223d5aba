#include "common/Logger.h"

#include <spdlog/sinks/null_sink.h>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace stratsim {

Logger::Logger(std::shared_ptr<spdlog::logger> main_logger,
               std::shared_ptr<spdlog::logger> order_logger)
    : main_logger_(std::move(main_logger))
    , order_logger_(std::move(order_logger))
{
}

std::shared_ptr<Logger> Logger::create(const std::string& name, const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    std::shared_ptr<spdlog::logger> order_logger;

    try {
        if (config.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!config.log_dir.empty()) {
            std::filesystem::create_directories(config.log_dir);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_dir + "/" + name + ".log", 1024 * 1024 * 10, 3
            );
            sinks.push_back(file_sink);

            auto order_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.log_dir + "/orders.log", 0, 0
            );
            order_logger = std::make_shared<spdlog::logger>(name + ".orders", order_sink);
            order_logger->set_pattern("%v");
        }
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto main_logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    main_logger->flush_on(spdlog::level::warn);

    auto logger = std::make_shared<Logger>(main_logger, order_logger);
    logger->setLevel(config.level);
    if (!config.log_dir.empty()) {
        logger->info("Log directory: {}", config.log_dir);
    }
    return logger;
}

std::shared_ptr<Logger> Logger::createConsole(const std::string& name) {
    LoggingConfig config;
    config.console = true;
    return create(name, config);
}

std::shared_ptr<Logger> Logger::createNull() {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    return std::make_shared<Logger>(std::make_shared<spdlog::logger>("null", sink));
}

void Logger::logOrder(const std::string& symbol, const OrderRecord& order) {
    if (order_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << order.timestamp << ","
            << std::fixed << std::setprecision(8) << order.price << ","
            << std::fixed << std::setprecision(8) << order.quantity << ","
            << std::fixed << std::setprecision(8) << order.filled_quantity << ","
            << toString(order.source);
        order_logger_->info(oss.str());
    }
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::flush() {
    if (main_logger_) {
        main_logger_->flush();
    }
    if (order_logger_) {
        order_logger_->flush();
    }
}

} // namespace stratsim

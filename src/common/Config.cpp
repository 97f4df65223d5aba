#include "common/Config.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace stratsim {

namespace {
// Single-element lists stand for their element.
const nlohmann::json& unwrap(const nlohmann::json& value) {
    if (value.is_array() && value.size() == 1) {
        return value[0];
    }
    return value;
}

double readNumber(const nlohmann::json& section, const std::string& key, double default_value) {
    if (!section.contains(key)) {
        return default_value;
    }
    const nlohmann::json& value = unwrap(section[key]);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        if (auto number = ParameterSet::parseNumber(value.get<std::string>())) {
            return *number;
        }
    }
    throw std::invalid_argument("Config: " + key + " must be a number, got " + value.dump());
}

std::string readText(const nlohmann::json& section, const std::string& key, const std::string& default_value) {
    if (!section.contains(key)) {
        return default_value;
    }
    const nlohmann::json& value = unwrap(section[key]);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    throw std::invalid_argument("Config: " + key + " must be a string, got " + value.dump());
}

bool readBool(const nlohmann::json& section, const std::string& key, bool default_value) {
    if (!section.contains(key)) {
        return default_value;
    }
    const nlohmann::json& value = unwrap(section[key]);
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    throw std::invalid_argument("Config: " + key + " must be a boolean, got " + value.dump());
}
}

Config Config::load(const std::string& config_path, Logger& logger) {
    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path);
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + config_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config JSON: " + std::string(e.what()));
    }

    logger.info("Config loaded: {}", config_path);
    return fromJson(j, logger);
}

Config Config::fromJson(const nlohmann::json& j, Logger& logger) {
    Config config;

    if (j.contains("instrument")) {
        const auto& s = j["instrument"];
        if (s.contains("id")) {
            const auto& id = unwrap(s["id"]);
            if (!id.is_number_integer()) {
                throw std::invalid_argument("Config: instrument id is invalid: " + id.dump());
            }
            config.instrument_config_.id = id.get<int>();
        }
        config.instrument_config_.name = readText(s, "name", config.instrument_config_.name);
        config.instrument_config_.symbol = readText(s, "symbol", config.instrument_config_.symbol);
        config.instrument_config_.type = readText(s, "type", config.instrument_config_.type);
    }

    if (j.contains("strategy")) {
        const auto& s = j["strategy"];
        config.engine_config_.fund = readNumber(s, "fund", config.engine_config_.fund);
        if (config.engine_config_.fund < 0) {
            throw std::invalid_argument("Config: fund must be >= 0, got " +
                                        std::to_string(config.engine_config_.fund));
        }
        config.engine_config_.unit = readNumber(s, "unit", config.engine_config_.unit);
        config.engine_config_.unit_init = readNumber(s, "unit_init", config.engine_config_.unit_init);
        config.engine_config_.mode = engine::engineModeFromString(
            readText(s, "mode", engine::toString(config.engine_config_.mode)));
    }

    if (j.contains("parameters")) {
        config.parameters_ = ParameterSet::fromJson(j["parameters"], logger);
    }

    if (j.contains("logging")) {
        const auto& s = j["logging"];
        config.logging_config_.level = readText(s, "level", config.logging_config_.level);
        config.logging_config_.log_dir = readText(s, "log_dir", config.logging_config_.log_dir);
        config.logging_config_.console = readBool(s, "console", config.logging_config_.console);
    }

    return config;
}

} // namespace stratsim

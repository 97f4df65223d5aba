#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "common/Logger.h"
#include "common/ParameterSet.h"
#include "engine/EngineConfig.h"

namespace stratsim {

// Run configuration read from a JSON file:
//   "instrument" : id, name, symbol, type
//   "strategy"   : fund, unit, unit_init, mode
//   "parameters" : flat subroutine parameters (coerced, see ParameterSet)
//   "logging"    : level, log_dir, console
class Config {
public:
    Config() = default;

    static Config load(const std::string& config_path, Logger& logger);
    static Config fromJson(const nlohmann::json& j, Logger& logger);

    const engine::InstrumentConfig& getInstrumentConfig() const { return instrument_config_; }
    const engine::EngineConfig& getEngineConfig() const { return engine_config_; }
    const ParameterSet& getParameters() const { return parameters_; }
    const LoggingConfig& getLoggingConfig() const { return logging_config_; }

    void setMode(engine::EngineMode mode) { engine_config_.mode = mode; }
    ParameterSet& mutableParameters() { return parameters_; }

private:
    engine::InstrumentConfig instrument_config_;
    engine::EngineConfig engine_config_;
    ParameterSet parameters_;
    LoggingConfig logging_config_;
};

} // namespace stratsim

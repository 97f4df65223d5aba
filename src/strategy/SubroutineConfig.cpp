#include "strategy/SubroutineConfig.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace stratsim {
namespace strategy {

namespace {
std::string normalizeMode(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void requireFraction(double value, const std::string& name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::invalid_argument(name + " must be in [0, 1], got " + std::to_string(value));
    }
}

void requirePositive(double value, const std::string& name) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(name + " must be > 0, got " + std::to_string(value));
    }
}

void requireNonNegative(double value, const std::string& name) {
    if (!(value >= 0.0)) {
        throw std::invalid_argument(name + " must be >= 0, got " + std::to_string(value));
    }
}
}

std::string toString(ChasingMode mode) {
    switch (mode) {
        case ChasingMode::CHASE: return "chase";
        case ChasingMode::SAFETY: return "safety";
    }
    return "chase";
}

ChasingMode chasingModeFromString(const std::string& value) {
    const std::string mode = normalizeMode(value);
    if (mode == "chase") return ChasingMode::CHASE;
    if (mode == "safety") return ChasingMode::SAFETY;
    throw std::invalid_argument("Unsupported chasing mode: " + value);
}

std::string toString(TurningMode mode) {
    switch (mode) {
        case TurningMode::INCREASE: return "increase";
        case TurningMode::DECREASE: return "decrease";
        case TurningMode::SIZE: return "size";
    }
    return "increase";
}

TurningMode turningModeFromString(const std::string& value) {
    const std::string mode = normalizeMode(value);
    if (mode == "increase") return TurningMode::INCREASE;
    if (mode == "decrease") return TurningMode::DECREASE;
    if (mode == "size") return TurningMode::SIZE;
    throw std::invalid_argument("Unsupported turning point mode: " + value);
}

std::string toString(PendingSide side) {
    return side == PendingSide::BUY ? "BUY" : "SELL";
}

// ===== ThresholdControlConfig =====

ThresholdControlConfig ThresholdControlConfig::fromParameters(const ParameterSet& params) {
    ThresholdControlConfig config;
    config.winning_per = params.getNumberOr("winningPer", config.winning_per);
    config.losing_per = params.getNumberOr("losingPer", config.losing_per);
    config.selling_per_win = params.getNumberOr("sellingPerWin", config.selling_per_win);
    config.selling_per_lose = params.getNumberOr("sellingPerLose", config.selling_per_lose);
    config.validate();
    return config;
}

void ThresholdControlConfig::validate() const {
    requireFraction(winning_per, "winningPer");
    requireFraction(losing_per, "losingPer");
    requireFraction(selling_per_win, "sellingPerWin");
    requireFraction(selling_per_lose, "sellingPerLose");
}

// ===== ChasingConfig =====

ChasingConfig ChasingConfig::fromParameters(const ParameterSet& params) {
    ChasingConfig config;
    // Only an explicit -1 selects a falling trend.
    config.trend = (params.getNumberOr("trend", 1.0) == -1.0) ? Trend::FALLING : Trend::RISING;
    if (auto mode = params.getText("mode_chase")) {
        config.mode = chasingModeFromString(*mode);
    }
    config.gap = params.getNumberOr("gap", config.gap);
    config.upper_limit = params.getNumberOr("upper_limit", config.upper_limit);
    config.lower_limit = params.getNumberOr("lower_limit", config.lower_limit);
    config.init = params.getNumberOr("init", config.init);
    config.inc = params.getNumberOr("inc", config.inc);
    config.safety_amount = params.getNumberOr("safetyamount", config.safety_amount);
    config.validate();
    return config;
}

void ChasingConfig::validate() const {
    if (trend == Trend::UNSET) {
        throw std::invalid_argument("Chasing trend must be RISING or FALLING");
    }
    requirePositive(gap, "gap");
    requirePositive(upper_limit, "upper_limit");
    requirePositive(lower_limit, "lower_limit");
    requireNonNegative(inc, "inc");
    requireNonNegative(safety_amount, "safetyamount");
    if (std::isnan(init)) {
        throw std::invalid_argument("init must be a number");
    }
}

// ===== TurningPointConfig =====

TurningPointConfig TurningPointConfig::fromParameters(const ParameterSet& params) {
    TurningPointConfig config;
    if (auto mode = params.getText("mode_turning")) {
        config.mode = turningModeFromString(*mode);
    }
    config.first_side = (params.getNumberOr("buysell", -1.0) == 1.0) ? PendingSide::BUY : PendingSide::SELL;
    config.n = params.getNumberOr("n", config.n);
    config.n_delta = params.getNumberOr("n_delta", config.n_delta);
    config.h = params.getNumberOr("h", config.h);
    config.validate();
    return config;
}

void TurningPointConfig::validate() const {
    requireNonNegative(n, "n");
    requireNonNegative(n_delta, "n_delta");
    requireNonNegative(h, "h");
}

} // namespace strategy
} // namespace stratsim

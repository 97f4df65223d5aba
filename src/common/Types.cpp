#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace stratsim {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string toString(InstrumentType type) {
    switch (type) {
        case InstrumentType::STOCK: return "stock";
        case InstrumentType::FUTURE: return "future";
    }
    return "stock";
}

InstrumentType instrumentTypeFromString(const std::string& value) {
    const std::string normalized = toLowerCopy(value);
    if (normalized == "stock") return InstrumentType::STOCK;
    if (normalized == "future") return InstrumentType::FUTURE;
    throw std::invalid_argument("Type of instrument is not supported: " + value);
}

std::string toString(Trend trend) {
    switch (trend) {
        case Trend::UNSET: return "UNSET";
        case Trend::RISING: return "RISING";
        case Trend::FALLING: return "FALLING";
    }
    return "UNSET";
}

std::string toString(ArmState state) {
    switch (state) {
        case ArmState::IDLE: return "IDLE";
        case ArmState::ARMED_BUY: return "ARMED_BUY";
        case ArmState::ARMED_SELL: return "ARMED_SELL";
    }
    return "IDLE";
}

std::string toString(OrderSource source) {
    switch (source) {
        case OrderSource::CHASE: return "chase";
        case OrderSource::TURNING: return "turning";
        case OrderSource::THRESHOLD_CONTROL: return "thresholdcontrol";
        case OrderSource::OTHER: return "other";
    }
    return "other";
}

OrderSource orderSourceFromString(const std::string& value) {
    const std::string normalized = toLowerCopy(value);
    if (normalized == "chase") return OrderSource::CHASE;
    if (normalized == "turning") return OrderSource::TURNING;
    if (normalized == "thresholdcontrol") return OrderSource::THRESHOLD_CONTROL;
    return OrderSource::OTHER;
}

} // namespace stratsim

#include "common/ParameterSet.h"
#include "common/Logger.h"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace stratsim {

std::optional<double> ParameterSet::parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
            ++consumed;
        }
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

ParameterSet ParameterSet::fromJson(const nlohmann::json& object, Logger& logger) {
    ParameterSet params;
    if (!object.is_object()) {
        logger.warn("Parameter section is not an object, ignoring it");
        return params;
    }

    for (auto it = object.begin(); it != object.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json* value = &it.value();

        // Single-element lists are unwrapped (query-string style input).
        if (value->is_array() && value->size() == 1) {
            value = &(*value)[0];
        }

        if (value->is_number()) {
            params.setNumber(key, value->get<double>());
        } else if (value->is_boolean()) {
            params.setNumber(key, value->get<bool>() ? 1.0 : 0.0);
        } else if (value->is_string()) {
            params.setRaw(key, value->get<std::string>());
        } else {
            logger.warn("Failed to convert parameter {}: {}", key, value->dump());
        }
    }

    logger.info("Parameters: {}", params.describe());
    return params;
}

void ParameterSet::setNumber(const std::string& key, double value) {
    values_[key] = value;
}

void ParameterSet::setText(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void ParameterSet::setRaw(const std::string& key, const std::string& raw) {
    if (auto number = parseNumber(raw)) {
        values_[key] = *number;
    } else {
        values_[key] = raw;
    }
}

bool ParameterSet::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool ParameterSet::isNumber(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && std::holds_alternative<double>(it->second);
}

bool ParameterSet::isText(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && std::holds_alternative<std::string>(it->second);
}

std::optional<double> ParameterSet::getNumber(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || !std::holds_alternative<double>(it->second)) {
        return std::nullopt;
    }
    return std::get<double>(it->second);
}

std::optional<std::string> ParameterSet::getText(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    if (std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    std::ostringstream oss;
    oss << std::get<double>(it->second);
    return oss.str();
}

double ParameterSet::getNumberOr(const std::string& key, double default_value) const {
    return getNumber(key).value_or(default_value);
}

std::string ParameterSet::getTextOr(const std::string& key, const std::string& default_value) const {
    return getText(key).value_or(default_value);
}

std::string ParameterSet::describe() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : values_) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << key << "=";
        if (std::holds_alternative<double>(value)) {
            oss << std::get<double>(value);
        } else {
            oss << "'" << std::get<std::string>(value) << "'";
        }
    }
    oss << "}";
    return oss.str();
}

} // namespace stratsim

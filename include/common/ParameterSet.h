#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace stratsim {

class Logger;

// Flat name -> value mapping shared by every subroutine.
// Values are numbers when they can be read as one, text otherwise.
class ParameterSet {
public:
    using Value = std::variant<double, std::string>;

    ParameterSet() = default;

    // Each member is coerced; members that are neither number nor text are dropped with a warning.
    static ParameterSet fromJson(const nlohmann::json& object, Logger& logger);

    // Whole-string numeric parse; trailing whitespace is allowed, anything else is not.
    static std::optional<double> parseNumber(const std::string& text);

    void setNumber(const std::string& key, double value);
    void setText(const std::string& key, const std::string& value);
    // "5" is stored as 5.0, "chase" as text.
    void setRaw(const std::string& key, const std::string& raw);

    bool contains(const std::string& key) const;
    bool isNumber(const std::string& key) const;
    bool isText(const std::string& key) const;

    std::optional<double> getNumber(const std::string& key) const;
    std::optional<std::string> getText(const std::string& key) const;
    double getNumberOr(const std::string& key, double default_value) const;
    std::string getTextOr(const std::string& key, const std::string& default_value) const;

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    std::string describe() const;

private:
    std::map<std::string, Value> values_;
};

} // namespace stratsim

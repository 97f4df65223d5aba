#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace stratsim {
namespace market {

// A stock or future with its latest price and the ordered history of past prices.
class Instrument {
public:
    Instrument(int id, std::string name, std::string symbol, InstrumentType type = InstrumentType::STOCK);
    Instrument(int id, std::string name, std::string symbol, const std::string& type);

    // Timestamps must be non-decreasing; this is not checked.
    void update(Timestamp timestamp, Price price);

    // NaN until the first update.
    Price price() const { return price_; }
    std::optional<Timestamp> timestamp() const { return timestamp_; }
    bool hasPrice() const { return timestamp_.has_value(); }

    const std::vector<PricePoint>& history() const { return history_; }

    int id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& symbol() const { return symbol_; }
    InstrumentType type() const { return type_; }

    std::string toString() const;

private:
    int id_;
    std::string name_;
    std::string symbol_;
    InstrumentType type_;

    Price price_;
    std::optional<Timestamp> timestamp_;
    std::vector<PricePoint> history_;
};

} // namespace market
} // namespace stratsim

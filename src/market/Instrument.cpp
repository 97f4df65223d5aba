#include "market/Instrument.h"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace stratsim {
namespace market {

Instrument::Instrument(int id, std::string name, std::string symbol, InstrumentType type)
    : id_(id)
    , name_(std::move(name))
    , symbol_(std::move(symbol))
    , type_(type)
    , price_(std::numeric_limits<double>::quiet_NaN())
{
    if (id_ < 0) {
        throw std::invalid_argument("Instrument id is invalid: " + std::to_string(id_));
    }
}

Instrument::Instrument(int id, std::string name, std::string symbol, const std::string& type)
    : Instrument(id, std::move(name), std::move(symbol), instrumentTypeFromString(type))
{
}

void Instrument::update(Timestamp timestamp, Price price) {
    price_ = price;
    timestamp_ = timestamp;
    history_.emplace_back(timestamp, price);
}

std::string Instrument::toString() const {
    std::ostringstream oss;
    oss << "[I][" << stratsim::toString(type_) << "," << id_ << "][" << symbol_ << "] "
        << name_ << ": " << price_ << " @ ";
    if (timestamp_) {
        oss << *timestamp_;
    } else {
        oss << "-";
    }
    return oss.str();
}

} // namespace market
} // namespace stratsim

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.h"

namespace stratsim {
namespace core {

struct JournalEntry {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    std::string symbol;
    double price = 0.0;
    double quantity = 0.0;
    double filled_quantity = 0.0;
    OrderSource source = OrderSource::OTHER;
};

class IOrderJournal {
public:
    virtual ~IOrderJournal() = default;

    virtual bool append(const std::string& symbol, const OrderRecord& order) = 0;
    virtual std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace stratsim

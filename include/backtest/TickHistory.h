#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/Logger.h"
#include "common/Types.h"

namespace stratsim {
namespace backtest {

class TickHistory {
public:
    // Expected format: timestamp,price (header rows and quoted cells are skipped / stripped)
    static std::vector<PricePoint> loadCSV(const std::string& file_path, Logger& logger);

    // Array of {"timestamp"|"t": ..., "price"|"p": ...}
    static std::vector<PricePoint> loadJSON(const std::string& file_path, Logger& logger);

    // Picks the loader from the file extension (.json, anything else is CSV).
    static std::vector<PricePoint> load(const std::string& file_path, Logger& logger);
};

} // namespace backtest
} // namespace stratsim

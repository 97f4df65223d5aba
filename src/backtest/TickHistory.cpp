#include "backtest/TickHistory.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace stratsim {
namespace backtest {

namespace {
void sortByTimestamp(std::vector<PricePoint>& ticks) {
    std::stable_sort(ticks.begin(), ticks.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.timestamp < b.timestamp;
    });
}
}

std::vector<PricePoint> TickHistory::loadCSV(const std::string& file_path, Logger& logger) {
    std::vector<PricePoint> ticks;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        logger.error("Failed to open CSV file: {}", file_path);
        return ticks;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 2) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            ticks.emplace_back(std::stoll(row[0]), std::stod(row[1]));
        } catch (const std::exception& e) {
            logger.warn("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTimestamp(ticks);
    logger.info("Loaded {} ticks from {}", ticks.size(), file_path);
    return ticks;
}

std::vector<PricePoint> TickHistory::loadJSON(const std::string& file_path, Logger& logger) {
    std::vector<PricePoint> ticks;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        logger.error("Failed to open JSON file: {}", file_path);
        return ticks;
    }

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            PricePoint tick;
            if (item.contains("timestamp")) tick.timestamp = item["timestamp"].get<Timestamp>();
            else if (item.contains("t")) tick.timestamp = item["t"].get<Timestamp>();
            else continue;

            if (item.contains("price")) tick.price = item["price"].get<Price>();
            else if (item.contains("p")) tick.price = item["p"].get<Price>();
            else continue;

            ticks.push_back(tick);
        }
        sortByTimestamp(ticks);
    } catch (const nlohmann::json::exception& e) {
        logger.error("Error parsing JSON file: {} - {}", file_path, e.what());
        ticks.clear();
    }

    logger.info("Loaded {} ticks from {}", ticks.size(), file_path);
    return ticks;
}

std::vector<PricePoint> TickHistory::load(const std::string& file_path, Logger& logger) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path, logger);
    }
    return loadCSV(file_path, logger);
}

} // namespace backtest
} // namespace stratsim

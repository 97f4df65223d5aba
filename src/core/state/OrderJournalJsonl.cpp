#include "core/state/OrderJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace stratsim {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

OrderJournalJsonl::OrderJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = std::max(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            // Malformed line; keep scanning.
        }
    }
}

bool OrderJournalJsonl::append(const std::string& symbol, const OrderRecord& order) {
    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = order.timestamp;
    line["symbol"] = symbol;
    line["price"] = order.price;
    line["quantity"] = order.quantity;
    line["filled_quantity"] = order.filled_quantity;
    line["source"] = toString(order.source);

    out << line.dump() << "\n";
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEntry> OrderJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::vector<JournalEntry> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        JournalEntry entry;
        try {
            const nlohmann::json line = nlohmann::json::parse(row);
            entry.seq = parseSeq(line);
            if (entry.seq < seq_inclusive) {
                continue;
            }
            entry.ts_ms = line.value("ts_ms", 0LL);
            entry.symbol = line.value("symbol", std::string());
            entry.price = line.value("price", 0.0);
            entry.quantity = line.value("quantity", 0.0);
            entry.filled_quantity = line.value("filled_quantity", 0.0);
            entry.source = orderSourceFromString(line.value("source", std::string("other")));
        } catch (const nlohmann::json::exception&) {
            continue;
        }
        out.push_back(std::move(entry));
    }

    return out;
}

std::uint64_t OrderJournalJsonl::lastSeq() const {
    return last_seq_;
}

} // namespace core
} // namespace stratsim

#pragma once

#include <cstdint>
#include <filesystem>

#include "core/contracts/IOrderJournal.h"

namespace stratsim {
namespace core {

// One JSON object per line; sequence numbers continue across reopen.
class OrderJournalJsonl : public IOrderJournal {
public:
    explicit OrderJournalJsonl(std::filesystem::path file_path);

    bool append(const std::string& symbol, const OrderRecord& order) override;
    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace stratsim

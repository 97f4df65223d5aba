#include "core/state/OrderJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::temp_directory_path() / "stratsim_test" / "order_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        stratsim::core::OrderJournalJsonl journal(path);
        if (journal.lastSeq() != 0) {
            std::cerr << "[TEST] fresh journal should start at 0, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const stratsim::OrderRecord first(1000, 106.0, 50.0, 50.0, stratsim::OrderSource::CHASE);
        const stratsim::OrderRecord second(2000, 110.0, -25.0, -25.0, stratsim::OrderSource::THRESHOLD_CONTROL);

        if (!journal.append("ACM", first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append("ACM", second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().symbol != "ACM" ||
            rows.front().source != stratsim::OrderSource::THRESHOLD_CONTROL ||
            rows.front().quantity != -25.0 ||
            rows.front().ts_ms != 2000) {
            std::cerr << "[TEST] unexpected row contents\n";
            return 1;
        }
    }

    // A garbage line is skipped and the sequence survives a reopen.
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "not json\n";
    }
    {
        stratsim::core::OrderJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }

        const stratsim::OrderRecord clipped(3000, 100.0, 500.0, 12.5, stratsim::OrderSource::TURNING);
        if (!reopened.append("ACM", clipped) || reopened.lastSeq() != 3) {
            std::cerr << "[TEST] append after reopen failed\n";
            return 1;
        }

        const auto rows = reopened.readFrom(1);
        if (rows.size() != 3) {
            std::cerr << "[TEST] readFrom(1) should return 3 rows, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.back().filled_quantity != 12.5 || rows.back().quantity != 500.0) {
            std::cerr << "[TEST] filled quantity not preserved\n";
            return 1;
        }
    }

    std::filesystem::remove_all(path.parent_path(), ec);
    std::cout << "[TEST] OrderJournal PASSED\n";
    return 0;
}

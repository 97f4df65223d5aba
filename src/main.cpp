#include "backtest/ReplayEngine.h"
#include "backtest/TickHistory.h"
#include "common/Config.h"
#include "common/Logger.h"
#include "core/state/OrderJournalJsonl.h"
#include "engine/EngineConfig.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace stratsim;

namespace {

struct CliOptions {
    std::string config_path;
    std::string ticks_path;
    std::string journal_path;
    std::string mode;
    std::string log_level;
};

void printUsage() {
    std::cout << "Usage: stratsim --config <file.json> --ticks <file.csv|file.json>\n"
              << "                [--journal <orders.jsonl>] [--mode chase|turning] [--log-level <level>]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        const std::string value = argv[++i];
        if (arg == "--config") options.config_path = value;
        else if (arg == "--ticks") options.ticks_path = value;
        else if (arg == "--journal") options.journal_path = value;
        else if (arg == "--mode") options.mode = value;
        else if (arg == "--log-level") options.log_level = value;
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return !options.config_path.empty() && !options.ticks_path.empty();
}

void printSummary(const backtest::ReplayEngine::Result& result) {
    std::cout << std::fixed << std::setprecision(4)
              << "\n========== Replay Result ==========\n"
              << "Ticks         : " << result.ticks << "\n"
              << "Baseline      : " << result.total0 << "\n"
              << "Final price   : " << result.final_price << "\n"
              << "Final fund    : " << result.final_fund << "\n"
              << "Final unit    : " << result.final_unit << "\n"
              << "Final total   : " << result.final_total << "\n"
              << "Total gain    : " << result.total_gain << "\n"
              << "Max drawdown  : " << (result.max_drawdown * 100.0) << "%\n"
              << "Orders        : " << result.total_orders
              << " (clipped " << result.clipped_orders << ")\n";
    for (const auto& [source, count] : result.orders_by_source) {
        std::cout << "  " << std::left << std::setw(18) << source << count << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 2;
    }

    auto bootstrap_logger = Logger::createConsole("stratsim");

    try {
        Config config = Config::load(options.config_path, *bootstrap_logger);
        if (!options.mode.empty()) {
            config.setMode(engine::engineModeFromString(options.mode));
        }

        LoggingConfig logging = config.getLoggingConfig();
        if (!options.log_level.empty()) {
            logging.level = options.log_level;
        }
        auto logger = Logger::create("stratsim", logging);

        const auto ticks = backtest::TickHistory::load(options.ticks_path, *logger);
        if (ticks.empty()) {
            logger->error("No ticks loaded from {}", options.ticks_path);
            return 1;
        }

        std::shared_ptr<core::IOrderJournal> journal;
        if (!options.journal_path.empty()) {
            journal = std::make_shared<core::OrderJournalJsonl>(options.journal_path);
        }

        backtest::ReplayEngine replay(
            config.getInstrumentConfig(),
            config.getEngineConfig(),
            config.getParameters(),
            logger,
            journal
        );
        replay.run(ticks);
        printSummary(replay.getResult());
    } catch (const std::invalid_argument& e) {
        bootstrap_logger->error("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        bootstrap_logger->error("{}", e.what());
        return 1;
    }

    return 0;
}

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/Logger.h"
#include "common/ParameterSet.h"
#include "common/Types.h"
#include "core/contracts/IOrderJournal.h"
#include "engine/EngineConfig.h"
#include "engine/StrategyEngine.h"
#include "market/Instrument.h"

namespace stratsim {
namespace backtest {

// Replays a recorded tick series through a StrategyEngine.
class ReplayEngine {
public:
    ReplayEngine(
        const engine::InstrumentConfig& instrument_config,
        const engine::EngineConfig& engine_config,
        const ParameterSet& params,
        std::shared_ptr<Logger> logger,
        std::shared_ptr<core::IOrderJournal> journal = nullptr
    );

    ReplayEngine(const ReplayEngine&) = delete;
    ReplayEngine& operator=(const ReplayEngine&) = delete;

    // The engine is built on the first tick, so the baseline uses that price.
    void run(const std::vector<PricePoint>& ticks);

    struct Result {
        int ticks = 0;
        double total0 = 0.0;
        double final_price = 0.0;
        double final_fund = 0.0;
        double final_unit = 0.0;
        double final_total = 0.0;
        double total_gain = 0.0;
        double max_drawdown = 0.0;      // fraction of the running peak total
        int total_orders = 0;
        int clipped_orders = 0;         // orders filled below the requested quantity
        std::map<std::string, int> orders_by_source;
    };
    Result getResult() const;

    const market::Instrument& instrument() const { return instrument_; }
    // Null until run() has seen a tick.
    const engine::StrategyEngine* engine() const { return engine_.get(); }

private:
    market::Instrument instrument_;
    engine::EngineConfig engine_config_;
    ParameterSet params_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<core::IOrderJournal> journal_;
    std::unique_ptr<engine::StrategyEngine> engine_;

    int ticks_ = 0;
    double peak_total_ = 0.0;
    double max_drawdown_ = 0.0;
};

} // namespace backtest
} // namespace stratsim

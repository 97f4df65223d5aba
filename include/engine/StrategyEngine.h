#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/Logger.h"
#include "common/ParameterSet.h"
#include "common/Types.h"
#include "core/contracts/IOrderJournal.h"
#include "engine/EngineConfig.h"
#include "market/Instrument.h"
#include "strategy/ChasingSubroutine.h"
#include "strategy/ThresholdControl.h"
#include "strategy/TurningPointSubroutine.h"

namespace stratsim {
namespace engine {

// Runs one strategy step per tick over a single instrument:
//   1. primary proposal from Chasing (chase) or TurningPoint (turning)
//   2. ThresholdControl may override it
//   3. the resulting amount is executed against fund / unit
class StrategyEngine {
public:
    StrategyEngine(
        const market::Instrument& inst,
        const EngineConfig& config,
        const ParameterSet& params,
        std::shared_ptr<Logger> logger,
        std::shared_ptr<core::IOrderJournal> journal = nullptr
    );

    // Call after the instrument has received this tick's price.
    void update();

    // Positive n buys, negative n sells. A buy the fund cannot cover is clipped
    // to fund / price and leaves the fund at zero.
    void transact(double n, OrderSource source = OrderSource::OTHER);

    EngineMode mode() const { return config_.mode; }
    double fund() const { return fund_; }
    double unit() const { return unit_; }
    double unitInit() const { return config_.unit_init; }
    double total0() const { return total0_; }
    double total() const;
    double gain() const;

    const ParameterSet& parameters() const { return params_; }
    const strategy::ThresholdControl& thresholdControl() const { return threshold_control_; }
    const strategy::ChasingSubroutine& chasing() const { return chasing_; }
    const strategy::TurningPointSubroutine& turningPoint() const { return turning_point_; }

    const std::vector<Timestamp>& timestamps() const { return timestamps_; }
    const std::vector<Price>& prices() const { return prices_; }
    const std::vector<double>& funds() const { return funds_; }
    const std::vector<double>& units() const { return units_; }
    const std::vector<double>& gains() const { return gains_; }
    const std::vector<OrderRecord>& orders() const { return orders_; }

private:
    strategy::IPriceSubroutine& primary();
    OrderSource modeSource() const;

    const market::Instrument& inst_;
    EngineConfig config_;
    ParameterSet params_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<core::IOrderJournal> journal_;

    double fund_;
    double unit_;
    double total0_;

    strategy::ThresholdControl threshold_control_;
    strategy::ChasingSubroutine chasing_;
    strategy::TurningPointSubroutine turning_point_;

    std::vector<Timestamp> timestamps_;
    std::vector<Price> prices_;
    std::vector<double> funds_;
    std::vector<double> units_;
    std::vector<double> gains_;
    std::vector<OrderRecord> orders_;
};

} // namespace engine
} // namespace stratsim

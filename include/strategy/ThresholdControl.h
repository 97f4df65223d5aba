#pragma once

#include <memory>
#include <vector>

#include "common/Logger.h"
#include "market/Instrument.h"
#include "strategy/ISubroutine.h"
#include "strategy/SubroutineConfig.h"

namespace stratsim {
namespace strategy {

// Moves holdings back toward neutral once the gain measured against a fixed
// baseline (total0) crosses the winning or losing percentage.
class ThresholdControl : public ISubroutine {
public:
    ThresholdControl(
        const market::Instrument& inst,
        double fund,
        double unit,
        const ThresholdControlConfig& config,
        std::shared_ptr<Logger> logger
    );

    // delta_unit is the trade proposed for this tick. Returns the override amount,
    // or 0 when the proposal may go through unchanged.
    double update(double fund, double delta_unit = 0.0);

    // Re-anchors the baseline to the given position. Configuration is kept.
    void reset(double fund, double unit);

    SubroutineInfo getInfo() const override;
    double output() const override { return last_output_; }

    double total0() const { return total0_; }
    const ThresholdControlConfig& config() const { return config_; }
    int resetCount() const { return reset_count_; }

    const std::vector<double>& funds() const { return funds_; }
    const std::vector<double>& units() const { return units_; }
    const std::vector<Price>& prices() const { return prices_; }
    const std::vector<Timestamp>& times() const { return times_; }

private:
    double rebalance(double fund, double unit, double gain, double selling_per, const char* label);

    const market::Instrument& inst_;
    ThresholdControlConfig config_;
    std::shared_ptr<Logger> logger_;

    double total0_;
    double last_output_;
    int reset_count_;

    std::vector<double> funds_;
    std::vector<double> units_;
    std::vector<Price> prices_;
    std::vector<Timestamp> times_;
};

} // namespace strategy
} // namespace stratsim

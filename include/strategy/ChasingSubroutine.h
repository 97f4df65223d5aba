#pragma once

#include <memory>
#include <vector>

#include "common/Logger.h"
#include "market/Instrument.h"
#include "strategy/ISubroutine.h"
#include "strategy/ReversalTracker.h"
#include "strategy/SubroutineConfig.h"

namespace stratsim {
namespace strategy {

// Follows the larger-scale trend using stepped price thresholds.
//
// chase  : stacks buys (or sells when the trend is falling) of shrinking size
//          each time the price breaks the next step and keeps going.
// safety : sells (or buys when falling) a fixed amount at turning points.
//
// Meant to run under ThresholdControl. Shorting is not considered.
class ChasingSubroutine : public IPriceSubroutine {
public:
    // unit is the reference holding the subroutine starts from; it is not evaluated.
    ChasingSubroutine(
        const market::Instrument& inst,
        double unit,
        const ChasingConfig& config,
        std::shared_ptr<Logger> logger
    );

    double update() override;
    double output() const override { return last_output_; }
    SubroutineInfo getInfo() const override;

    const ChasingConfig& config() const { return config_; }
    Trend direction() const { return tracker_.direction(); }
    Price high() const { return tracker_.high(); }
    Price low() const { return tracker_.low(); }
    ArmState armState() const { return arm_state_; }
    double nextStepUp() const { return next_step_up_; }
    double nextStepDown() const { return next_step_down_; }
    int stack() const { return stack_; }

    const std::vector<Price>& prices() const { return prices_; }
    const std::vector<Timestamp>& times() const { return times_; }

private:
    double updateChaseRising(Price price);
    double updateChaseFalling(Price price);
    double updateSafetyRising(Price price, Trend move);
    double updateSafetyFalling(Price price, Trend move);
    double stackedAmount();

    const market::Instrument& inst_;
    ChasingConfig config_;
    std::shared_ptr<Logger> logger_;
    ReversalTracker tracker_;

    ArmState arm_state_;
    double next_step_up_;
    double next_step_down_;
    int stack_;
    double last_output_;

    std::vector<Price> prices_;
    std::vector<Timestamp> times_;
};

} // namespace strategy
} // namespace stratsim

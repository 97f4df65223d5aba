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

// Trades small-scale oscillations: alternately buys after a rise of h off the last
// low and sells after a fall of h off the last high. Trade sizes grow with the
// realized gain according to the mode.
class TurningPointSubroutine : public IPriceSubroutine {
public:
    TurningPointSubroutine(
        const market::Instrument& inst,
        const TurningPointConfig& config,
        std::shared_ptr<Logger> logger
    );

    double update() override;
    double output() const override { return last_output_; }
    SubroutineInfo getInfo() const override;

    const TurningPointConfig& config() const { return config_; }
    Trend direction() const { return tracker_.direction(); }
    Price high() const { return tracker_.high(); }
    Price low() const { return tracker_.low(); }
    PendingSide pendingSide() const { return pending_side_; }
    double buying() const { return buying_; }
    double selling() const { return selling_; }
    double gain() const { return gain_; }
    int tradeCount() const { return trade_count_; }

    const std::vector<Price>& prices() const { return prices_; }
    const std::vector<Timestamp>& times() const { return times_; }
    const std::vector<Price>& highs() const { return highs_; }
    const std::vector<Price>& lows() const { return lows_; }
    const std::vector<double>& gains() const { return gains_; }

private:
    void adaptSize(Price price);

    const market::Instrument& inst_;
    TurningPointConfig config_;
    std::shared_ptr<Logger> logger_;
    ReversalTracker tracker_;

    PendingSide pending_side_;
    double buying_;
    double selling_;
    double gain_;
    int trade_count_;
    double last_output_;

    std::vector<Price> prices_;
    std::vector<Timestamp> times_;
    std::vector<Price> highs_;
    std::vector<Price> lows_;
    std::vector<double> gains_;
};

} // namespace strategy
} // namespace stratsim

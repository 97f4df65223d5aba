#include "strategy/ThresholdControl.h"

#include <cmath>

namespace stratsim {
namespace strategy {

ThresholdControl::ThresholdControl(
    const market::Instrument& inst,
    double fund,
    double unit,
    const ThresholdControlConfig& config,
    std::shared_ptr<Logger> logger
)
    : inst_(inst)
    , config_(config)
    , logger_(logger ? std::move(logger) : Logger::createNull())
    , total0_(0.0)
    , last_output_(0.0)
    , reset_count_(0)
{
    config_.validate();
    reset(fund, unit);
    reset_count_ = 0;
}

void ThresholdControl::reset(double fund, double unit) {
    funds_.assign(1, fund);
    units_.assign(1, unit);
    prices_.assign(1, inst_.price());
    times_.assign(1, inst_.timestamp().value_or(0));
    total0_ = fund + unit * inst_.price();
    last_output_ = 0.0;
    ++reset_count_;
    logger_->debug("[ThresholdControl] baseline total0={:.4f} (fund={:.4f}, unit={:.4f})",
                   total0_, fund, unit);
}

double ThresholdControl::update(double fund, double delta_unit) {
    last_output_ = 0.0;

    const double unit = units_.back() + delta_unit;
    if (unit == 0.0) {
        return 0.0;
    }

    const Price price = inst_.price();
    prices_.push_back(price);
    times_.push_back(inst_.timestamp().value_or(0));

    const double total = fund + unit * price;
    const double gain = total - total0_;

    // gain == 0 lands in the winning branch.
    if (gain >= 0 && gain / total0_ >= config_.winning_per) {
        return rebalance(fund, unit, gain, config_.selling_per_win, "Winning");
    }
    if (gain <= 0 && std::abs(gain / total0_) >= config_.losing_per) {
        return rebalance(fund, unit, gain, config_.selling_per_lose, "Losing");
    }

    funds_.push_back(fund);
    units_.push_back(unit);
    return 0.0;
}

double ThresholdControl::rebalance(double fund, double unit, double gain, double selling_per, const char* label) {
    double amount = std::abs(unit) * selling_per;
    if (amount >= std::abs(unit)) {
        amount = std::abs(unit);
    }
    if (unit > 0) {
        amount = -amount;
    }

    logger_->info("{} Control: gain={:.4f}({:.4f}), trading {:.4f} units",
                  label, gain, gain / total0_, amount);

    units_.push_back(unit + amount);
    funds_.push_back(fund - amount * inst_.price());
    last_output_ = amount;
    return amount;
}

SubroutineInfo ThresholdControl::getInfo() const {
    SubroutineInfo info;
    info.name = "thresholdcontrol";
    info.description = "Baseline-relative de-risking toward a neutral holding";
    info.mode = "threshold";
    return info;
}

} // namespace strategy
} // namespace stratsim

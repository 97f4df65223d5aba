#include "strategy/ChasingSubroutine.h"

namespace stratsim {
namespace strategy {

ChasingSubroutine::ChasingSubroutine(
    const market::Instrument& inst,
    double unit,
    const ChasingConfig& config,
    std::shared_ptr<Logger> logger
)
    : inst_(inst)
    , config_(config)
    , logger_(logger ? std::move(logger) : Logger::createNull())
    , tracker_(inst.price())
    , arm_state_(ArmState::IDLE)
    , next_step_up_(inst.price() + config.gap)
    , next_step_down_(inst.price() - config.gap)
    , stack_(0)
    , last_output_(0.0)
{
    config_.validate();
    prices_.push_back(inst_.price());
    times_.push_back(inst_.timestamp().value_or(0));

    logger_->info("[Chasing] mode={} trend={} gap={} init={} inc={} reference={:.2f}",
                  toString(config_.mode), stratsim::toString(config_.trend),
                  config_.gap, config_.init, config_.inc, inst_.price() * unit);
}

SubroutineInfo ChasingSubroutine::getInfo() const {
    SubroutineInfo info;
    info.name = "chase";
    info.description = "Stepped trend following with diminishing stacked trades";
    info.mode = toString(config_.mode);
    return info;
}

double ChasingSubroutine::update() {
    const Price price = inst_.price();
    prices_.push_back(price);
    times_.push_back(inst_.timestamp().value_or(0));

    last_output_ = 0.0;
    const PriceMove move = tracker_.observe(price);
    if (!move.actionable()) {
        return 0.0;
    }

    double amount = 0.0;
    if (config_.mode == ChasingMode::CHASE) {
        amount = (config_.trend == Trend::RISING) ? updateChaseRising(price) : updateChaseFalling(price);
    } else {
        amount = (config_.trend == Trend::RISING) ? updateSafetyRising(price, move.move)
                                                  : updateSafetyFalling(price, move.move);
    }

    if (amount != 0.0) {
        logger_->debug("[Chasing] price={} amount={} stack={} up={} down={} state={}",
                       price, amount, stack_, next_step_up_, next_step_down_,
                       stratsim::toString(arm_state_));
    }
    last_output_ = amount;
    return amount;
}

// Size of the next stacked trade; the stack only grows while the size is still positive.
double ChasingSubroutine::stackedAmount() {
    const double amount = config_.init - stack_ * config_.inc;
    if (amount <= 0) {
        return 0.0;
    }
    ++stack_;
    return amount;
}

// ===== chase =====

double ChasingSubroutine::updateChaseRising(Price price) {
    double amount = 0.0;
    if (price >= next_step_up_) {
        arm_state_ = ArmState::ARMED_BUY;
    }

    if (price >= next_step_up_ + config_.upper_limit) {
        if (arm_state_ == ArmState::ARMED_BUY) {
            amount = stackedAmount();
            next_step_up_ = price + config_.gap;
            arm_state_ = ArmState::IDLE;
        }
    } else if (price <= next_step_up_ - config_.lower_limit) {
        arm_state_ = ArmState::IDLE;
    }
    return amount;
}

double ChasingSubroutine::updateChaseFalling(Price price) {
    double amount = 0.0;
    if (price <= next_step_down_) {
        arm_state_ = ArmState::ARMED_SELL;
    }

    // Confirmation below the step uses lower_limit, retreat above it uses upper_limit.
    if (price <= next_step_down_ - config_.lower_limit) {
        if (arm_state_ == ArmState::ARMED_SELL) {
            amount = -stackedAmount();
            next_step_down_ = price - config_.gap;
            arm_state_ = ArmState::IDLE;
        }
    } else if (price >= next_step_down_ + config_.upper_limit) {
        arm_state_ = ArmState::IDLE;
    }
    return amount;
}

// ===== safety =====

double ChasingSubroutine::updateSafetyRising(Price price, Trend move) {
    if (arm_state_ == ArmState::IDLE) {
        if (price >= next_step_up_) {
            arm_state_ = ArmState::ARMED_SELL;
            next_step_up_ = price + config_.gap;
            next_step_down_ = price - config_.gap;
        } else if (price <= next_step_down_) {
            arm_state_ = ArmState::ARMED_SELL;
            next_step_down_ = price - config_.gap;
        }
        return 0.0;
    }

    if (arm_state_ == ArmState::ARMED_SELL && move == Trend::FALLING &&
        tracker_.high() - price >= config_.lower_limit) {
        arm_state_ = ArmState::IDLE;
        return -config_.safety_amount;
    }
    return 0.0;
}

double ChasingSubroutine::updateSafetyFalling(Price price, Trend move) {
    if (arm_state_ == ArmState::IDLE) {
        if (price <= next_step_down_) {
            arm_state_ = ArmState::ARMED_BUY;
            next_step_up_ = price + config_.gap;
            next_step_down_ = price - config_.gap;
        } else if (price >= next_step_up_) {
            arm_state_ = ArmState::ARMED_BUY;
            next_step_up_ = price + config_.gap;
        }
        return 0.0;
    }

    if (arm_state_ == ArmState::ARMED_BUY && move == Trend::RISING &&
        price - tracker_.low() >= config_.lower_limit) {
        arm_state_ = ArmState::IDLE;
        return config_.safety_amount;
    }
    // Armed but not confirmed: nothing to do on this tick.
    return 0.0;
}

} // namespace strategy
} // namespace stratsim

#include "strategy/TurningPointSubroutine.h"

#include <cmath>

namespace stratsim {
namespace strategy {

TurningPointSubroutine::TurningPointSubroutine(
    const market::Instrument& inst,
    const TurningPointConfig& config,
    std::shared_ptr<Logger> logger
)
    : inst_(inst)
    , config_(config)
    , logger_(logger ? std::move(logger) : Logger::createNull())
    , tracker_(inst.price())
    , pending_side_(config.first_side)
    , buying_(config.n)
    , selling_(config.n)
    , gain_(0.0)
    , trade_count_(0)
    , last_output_(0.0)
{
    config_.validate();
    prices_.push_back(inst_.price());
    times_.push_back(inst_.timestamp().value_or(0));
}

SubroutineInfo TurningPointSubroutine::getInfo() const {
    SubroutineInfo info;
    info.name = "turning";
    info.description = "Turning point oscillation trading with gain-adaptive sizing";
    info.mode = toString(config_.mode);
    return info;
}

double TurningPointSubroutine::update() {
    const Price price = inst_.price();
    prices_.push_back(price);
    times_.push_back(inst_.timestamp().value_or(0));

    last_output_ = 0.0;
    const PriceMove move = tracker_.observe(price);
    if (!move.actionable()) {
        return 0.0;
    }

    if (move.reversed_down) {
        highs_.push_back(tracker_.high());
    } else if (move.reversed_up) {
        lows_.push_back(tracker_.low());
    }

    double amount = 0.0;
    if (pending_side_ == PendingSide::BUY && move.move == Trend::RISING &&
        price - tracker_.low() >= config_.h) {
        amount = buying_;
        gain_ -= amount * price;
        pending_side_ = PendingSide::SELL;
    } else if (pending_side_ == PendingSide::SELL && move.move == Trend::FALLING &&
               tracker_.high() - price >= config_.h) {
        amount = -selling_;
        gain_ -= amount * price;
        pending_side_ = PendingSide::BUY;
    }
    gains_.push_back(gain_);

    if (amount != 0.0) {
        logger_->debug("[TurningPoint] price={} amount={} next={}", price, amount, toString(pending_side_));
        ++trade_count_;
        adaptSize(price);
    }
    last_output_ = amount;
    return amount;
}

// Grow the trade size by n_delta, but never by more whole units than the gain can pay for.
void TurningPointSubroutine::adaptSize(Price price) {
    double step = config_.n_delta;
    const double affordable = gain_ / price;
    if (step > affordable) {
        step = std::floor(affordable);
    }
    if (step < 0) {
        step = 0;
    }

    logger_->info("[TurningPoint] gain={:.4f}, delta={}, affordable={:.4f}", gain_, step, affordable);

    switch (config_.mode) {
        case TurningMode::INCREASE:
            buying_ += step;
            break;
        case TurningMode::DECREASE:
            selling_ += step;
            break;
        case TurningMode::SIZE:
            buying_ += step;
            selling_ += step;
            break;
    }
}

} // namespace strategy
} // namespace stratsim

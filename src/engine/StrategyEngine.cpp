#include "engine/StrategyEngine.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace stratsim {
namespace engine {

std::string toString(EngineMode mode) {
    switch (mode) {
        case EngineMode::CHASE: return "chase";
        case EngineMode::TURNING: return "turning";
    }
    return "chase";
}

EngineMode engineModeFromString(const std::string& value) {
    std::string mode = value;
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (mode == "chase") return EngineMode::CHASE;
    if (mode == "turning") return EngineMode::TURNING;
    throw std::invalid_argument("Mode not supported: " + value);
}

StrategyEngine::StrategyEngine(
    const market::Instrument& inst,
    const EngineConfig& config,
    const ParameterSet& params,
    std::shared_ptr<Logger> logger,
    std::shared_ptr<core::IOrderJournal> journal
)
    : inst_(inst)
    , config_(config)
    , params_(params)
    , logger_(logger ? std::move(logger) : Logger::createNull())
    , journal_(std::move(journal))
    , fund_(config.fund)
    , unit_(config.unit)
    , total0_(config.fund + config.unit * inst.price())
    , threshold_control_(inst, config.fund, config.unit,
                         strategy::ThresholdControlConfig::fromParameters(params), logger_)
    , chasing_(inst, config.unit_init, strategy::ChasingConfig::fromParameters(params), logger_)
    , turning_point_(inst, strategy::TurningPointConfig::fromParameters(params), logger_)
{
    if (fund_ < 0) {
        throw std::invalid_argument("StrategyEngine: fund must be >= 0, got " + std::to_string(fund_));
    }
    logger_->info("StrategyEngine initialized - {} mode={} fund={:.2f} unit={:.4f} total0={:.2f}",
                  inst_.symbol(), toString(config_.mode), fund_, unit_, total0_);
}

double StrategyEngine::total() const {
    return fund_ + unit_ * inst_.price();
}

double StrategyEngine::gain() const {
    return total() - total0_;
}

strategy::IPriceSubroutine& StrategyEngine::primary() {
    if (config_.mode == EngineMode::CHASE) {
        return chasing_;
    }
    return turning_point_;
}

OrderSource StrategyEngine::modeSource() const {
    return config_.mode == EngineMode::CHASE ? OrderSource::CHASE : OrderSource::TURNING;
}

void StrategyEngine::update() {
    timestamps_.push_back(inst_.timestamp().value_or(0));
    prices_.push_back(inst_.price());
    funds_.push_back(fund_);
    units_.push_back(unit_);
    gains_.push_back(gain());

    const double n = primary().update();
    const double n2 = threshold_control_.update(fund_, n);

    if (n2 == 0.0) {
        if (n != 0.0) {
            transact(n, modeSource());
        }
        return;
    }

    logger_->info("ThresholdControl override: {:.4f} (proposal {:.4f} dropped)", n2, n);
    transact(n2, OrderSource::THRESHOLD_CONTROL);
    threshold_control_.reset(fund_, unit_);
}

void StrategyEngine::transact(double n, OrderSource source) {
    const Price price = inst_.price();
    double filled = n;

    if (fund_ - price * n <= 0) {
        filled = fund_ / price;
        logger_->warn("Running out of funds when trying to transact {:.4f}, filling {:.4f}", n, filled);
        unit_ += filled;
        fund_ = 0.0;
    } else {
        fund_ -= price * n;
        unit_ += n;
    }

    orders_.emplace_back(inst_.timestamp().value_or(0), price, n, filled, source);
    const OrderRecord& order = orders_.back();
    logger_->logOrder(inst_.symbol(), order);

    if (journal_ && !journal_->append(inst_.symbol(), order)) {
        logger_->error("Order journal append failed ({} {:.4f} @ {:.4f})",
                       toString(order.source), order.quantity, order.price);
    }
}

} // namespace engine
} // namespace stratsim

#include "backtest/ReplayEngine.h"

#include <algorithm>
#include <cmath>

namespace stratsim {
namespace backtest {

ReplayEngine::ReplayEngine(
    const engine::InstrumentConfig& instrument_config,
    const engine::EngineConfig& engine_config,
    const ParameterSet& params,
    std::shared_ptr<Logger> logger,
    std::shared_ptr<core::IOrderJournal> journal
)
    : instrument_(instrument_config.id, instrument_config.name, instrument_config.symbol, instrument_config.type)
    , engine_config_(engine_config)
    , params_(params)
    , logger_(logger ? std::move(logger) : Logger::createNull())
    , journal_(std::move(journal))
{
}

void ReplayEngine::run(const std::vector<PricePoint>& ticks) {
    if (ticks.empty()) {
        logger_->warn("Replay skipped: no ticks for {}", instrument_.symbol());
        return;
    }

    logger_->info("Replay started: {} ticks, {}", ticks.size(), instrument_.toString());

    for (const auto& tick : ticks) {
        instrument_.update(tick.timestamp, tick.price);
        if (!engine_) {
            engine_ = std::make_unique<engine::StrategyEngine>(
                instrument_, engine_config_, params_, logger_, journal_);
            peak_total_ = engine_->total();
        }

        engine_->update();
        ++ticks_;

        const double total = engine_->total();
        peak_total_ = std::max(peak_total_, total);
        if (peak_total_ > 0.0) {
            max_drawdown_ = std::max(max_drawdown_, (peak_total_ - total) / peak_total_);
        }
    }

    const Result result = getResult();
    logger_->info("Replay finished: ticks={} orders={} fund={:.2f} unit={:.4f} gain={:.2f} max_dd={:.2f}%",
                  result.ticks, result.total_orders, result.final_fund, result.final_unit,
                  result.total_gain, result.max_drawdown * 100.0);
    logger_->flush();
}

ReplayEngine::Result ReplayEngine::getResult() const {
    Result result;
    result.ticks = ticks_;
    result.max_drawdown = max_drawdown_;
    if (!engine_) {
        result.final_fund = engine_config_.fund;
        result.final_unit = engine_config_.unit;
        return result;
    }

    result.total0 = engine_->total0();
    result.final_price = instrument_.price();
    result.final_fund = engine_->fund();
    result.final_unit = engine_->unit();
    result.final_total = engine_->total();
    result.total_gain = engine_->gain();

    for (const auto& order : engine_->orders()) {
        result.total_orders++;
        result.orders_by_source[toString(order.source)]++;
        if (std::abs(order.filled_quantity - order.quantity) > 1e-12) {
            result.clipped_orders++;
        }
    }
    return result;
}

} // namespace backtest
} // namespace stratsim

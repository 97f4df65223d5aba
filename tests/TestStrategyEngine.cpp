#include "engine/StrategyEngine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace stratsim;
using stratsim::engine::EngineConfig;
using stratsim::engine::EngineMode;
using stratsim::engine::StrategyEngine;
using stratsim::market::Instrument;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

EngineConfig engineConfig(EngineMode mode, double fund, double unit) {
    EngineConfig config;
    config.mode = mode;
    config.fund = fund;
    config.unit = unit;
    config.unit_init = 0.0;
    return config;
}

// Thresholds wide enough that the control never fires on small paths.
ParameterSet quietParameters() {
    ParameterSet params;
    params.setNumber("winningPer", 1.0);
    params.setNumber("losingPer", 1.0);
    return params;
}

void feed(Instrument& inst, StrategyEngine& engine, const std::vector<double>& path) {
    Timestamp ts = inst.timestamp().value_or(0);
    for (double price : path) {
        inst.update(++ts, price);
        engine.update();
    }
}

void testTransactClipsToFund(const std::shared_ptr<Logger>& logger) {
    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 10.0);
    StrategyEngine engine(inst, engineConfig(EngineMode::CHASE, 1000.0, 0.0), quietParameters(), logger);

    engine.transact(500.0, OrderSource::OTHER);
    assert(engine.fund() == 0.0);
    assert(near(engine.unit(), 100.0));
    assert(engine.orders().size() == 1);
    assert(engine.orders()[0].quantity == 500.0);
    assert(near(engine.orders()[0].filled_quantity, 100.0));

    // sells always go through and restore the fund
    engine.transact(-40.0, OrderSource::OTHER);
    assert(near(engine.fund(), 400.0));
    assert(near(engine.unit(), 60.0));
    assert(engine.orders()[1].filled_quantity == -40.0);
}

void testTransactExactFundIsClipped(const std::shared_ptr<Logger>& logger) {
    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 10.0);
    StrategyEngine engine(inst, engineConfig(EngineMode::CHASE, 1000.0, 0.0), quietParameters(), logger);

    engine.transact(100.0, OrderSource::OTHER);
    assert(engine.fund() == 0.0);
    assert(near(engine.unit(), 100.0));
    assert(near(engine.orders()[0].filled_quantity, 100.0));
}

void testChaseOrdersAreTagged(const std::shared_ptr<Logger>& logger) {
    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 100.0);
    StrategyEngine engine(inst, engineConfig(EngineMode::CHASE, 10000.0, 0.0), quietParameters(), logger);
    assert(near(engine.total0(), 10000.0));

    feed(inst, engine, {102.0, 104.0, 106.0, 111.0});

    assert(engine.orders().size() == 1);
    const OrderRecord& order = engine.orders()[0];
    assert(order.source == OrderSource::CHASE);
    assert(order.quantity == 50.0);
    assert(order.price == 106.0);
    assert(order.timestamp == 3);
    assert(near(engine.fund(), 10000.0 - 50.0 * 106.0));
    assert(near(engine.unit(), 50.0));
    assert(engine.prices().size() == 4);
    assert(engine.units().size() == 4);
    // histories are captured before the tick's decision
    assert(engine.units()[2] == 0.0);
    assert(engine.units()[3] == 50.0);
    assert(near(engine.gain(), engine.total() - engine.total0()));
}

void testThresholdControlOverrides(const std::shared_ptr<Logger>& logger) {
    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 100.0);
    StrategyEngine engine(inst, engineConfig(EngineMode::CHASE, 10000.0, 0.0), ParameterSet(), logger);

    // The chase proposal of +50 at 106 lifts the evaluated gain to 53%,
    // so the control takes over and sells half of the proposed holding.
    feed(inst, engine, {102.0, 104.0, 106.0});

    assert(engine.orders().size() == 1);
    const OrderRecord& order = engine.orders()[0];
    assert(order.source == OrderSource::THRESHOLD_CONTROL);
    assert(near(order.quantity, -25.0));
    assert(near(engine.unit(), -25.0));
    assert(near(engine.fund(), 10000.0 + 25.0 * 106.0));
    assert(engine.chasing().stack() == 1);

    const auto& control = engine.thresholdControl();
    assert(control.resetCount() == 1);
    assert(near(control.total0(), engine.fund() + engine.unit() * 106.0));
    assert(control.units().size() == 1);

    feed(inst, engine, {111.0});
    assert(engine.orders().size() == 1);
}

void testTurningMode(const std::shared_ptr<Logger>& logger) {
    ParameterSet params = quietParameters();
    params.setNumber("buysell", 1.0);
    params.setNumber("n", 10.0);
    params.setNumber("h", 1.0);

    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 102.0);
    StrategyEngine engine(inst, engineConfig(EngineMode::TURNING, 10000.0, 0.0), params, logger);
    assert(engine.mode() == EngineMode::TURNING);

    feed(inst, engine, {102.0, 100.0, 101.5, 103.0, 101.9});

    assert(engine.orders().size() == 2);
    assert(engine.orders()[0].source == OrderSource::TURNING);
    assert(engine.orders()[0].quantity == 10.0);
    assert(engine.orders()[1].quantity == -10.0);
    assert(near(engine.unit(), 0.0));
    assert(near(engine.fund(), 10000.0 - 1015.0 + 1019.0));
    // the chase subroutine is not consulted in turning mode
    assert(engine.chasing().prices().size() == 1);
}

void testNegativeFundRejected(const std::shared_ptr<Logger>& logger) {
    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 10.0);
    bool threw = false;
    try {
        StrategyEngine engine(inst, engineConfig(EngineMode::CHASE, -100.0, 0.0), quietParameters(), logger);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void testRepeatedPricesAreIdle(const std::shared_ptr<Logger>& logger) {
    Instrument inst(1, "Acme", "ACM");
    inst.update(0, 100.0);
    StrategyEngine engine(inst, engineConfig(EngineMode::CHASE, 10000.0, 0.0), ParameterSet(), logger);
    feed(inst, engine, {100.0, 100.0, 100.0});
    assert(engine.orders().empty());
    assert(engine.fund() == 10000.0);
    assert(engine.gains().size() == 3);
}

}

int main() {
    auto logger = Logger::createNull();

    testTransactClipsToFund(logger);
    testTransactExactFundIsClipped(logger);
    testChaseOrdersAreTagged(logger);
    testThresholdControlOverrides(logger);
    testTurningMode(logger);
    testNegativeFundRejected(logger);
    testRepeatedPricesAreIdle(logger);

    std::cout << "[TEST] StrategyEngine PASSED\n";
    return 0;
}

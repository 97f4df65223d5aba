#include "strategy/TurningPointSubroutine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace stratsim;
using stratsim::market::Instrument;
using stratsim::strategy::PendingSide;
using stratsim::strategy::TurningMode;
using stratsim::strategy::TurningPointConfig;
using stratsim::strategy::TurningPointSubroutine;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

std::vector<double> feed(Instrument& inst, TurningPointSubroutine& turning, const std::vector<double>& path) {
    std::vector<double> outputs;
    Timestamp ts = 1;
    for (double price : path) {
        inst.update(ts++, price);
        outputs.push_back(turning.update());
    }
    return outputs;
}

TurningPointConfig baseConfig(PendingSide first_side, TurningMode mode) {
    TurningPointConfig config;
    config.first_side = first_side;
    config.mode = mode;
    config.n = 10.0;
    config.n_delta = 1.0;
    config.h = 1.0;
    return config;
}

}

int main() {
    auto logger = Logger::createNull();

    // Buy on the rebound from a low, then sell on the pullback from a high.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 102.0);
        TurningPointSubroutine turning(inst, baseConfig(PendingSide::BUY, TurningMode::INCREASE), logger);
        assert(turning.pendingSide() == PendingSide::BUY);

        const auto out = feed(inst, turning, {102.0, 100.0, 101.5, 103.0, 101.9});
        assert(out[0] == 0.0);
        assert(out[1] == 0.0);
        assert(out[2] == 10.0);
        assert(out[3] == 0.0);
        assert(out[4] == -10.0);

        assert(turning.tradeCount() == 2);
        assert(near(turning.gain(), 10.0 * (101.9 - 101.5)));
        assert(turning.lows().size() == 1 && turning.lows()[0] == 100.0);
        assert(turning.highs().size() == 1 && turning.highs()[0] == 103.0);
        // neither trade had enough realized gain to grow the size
        assert(turning.buying() == 10.0);
        assert(turning.selling() == 10.0);
        assert(turning.pendingSide() == PendingSide::BUY);
        assert(turning.gains().size() == 3);
    }

    // A rebound smaller than h does not trade.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 102.0);
        TurningPointSubroutine turning(inst, baseConfig(PendingSide::BUY, TurningMode::INCREASE), logger);
        const auto out = feed(inst, turning, {100.0, 100.5, 100.9});
        for (double amount : out) {
            assert(amount == 0.0);
        }
        assert(turning.tradeCount() == 0);
        assert(turning.pendingSide() == PendingSide::BUY);
    }

    // Realized gain grows both sides in size mode.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 100.0);
        TurningPointSubroutine turning(inst, baseConfig(PendingSide::SELL, TurningMode::SIZE), logger);
        const auto out = feed(inst, turning, {101.0, 102.0, 100.5});
        assert(out[2] == -10.0);
        assert(near(turning.gain(), 1005.0));
        assert(turning.buying() == 11.0);
        assert(turning.selling() == 11.0);
        assert(turning.pendingSide() == PendingSide::BUY);
    }

    // Decrease mode only grows the selling side.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 100.0);
        TurningPointSubroutine turning(inst, baseConfig(PendingSide::SELL, TurningMode::DECREASE), logger);
        feed(inst, turning, {101.0, 102.0, 100.5});
        assert(turning.buying() == 10.0);
        assert(turning.selling() == 11.0);
    }

    // The step is capped by how many whole units the gain can pay for.
    {
        TurningPointConfig config = baseConfig(PendingSide::SELL, TurningMode::INCREASE);
        config.n = 2.0;
        config.n_delta = 5.0;
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 100.0);
        TurningPointSubroutine turning(inst, config, logger);
        feed(inst, turning, {101.0, 102.0, 100.0});
        // gain 200 at price 100 affords 2 units
        assert(near(turning.gain(), 200.0));
        assert(turning.buying() == 4.0);
    }

    // Repeated prices leave decision state untouched.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 100.0);
        TurningPointSubroutine turning(inst, baseConfig(PendingSide::BUY, TurningMode::INCREASE), logger);
        feed(inst, turning, {99.0, 98.0});
        const auto out = feed(inst, turning, {98.0, 98.0, 98.0});
        for (double amount : out) {
            assert(amount == 0.0);
        }
        assert(turning.direction() == Trend::FALLING);
        assert(turning.gains().size() == 1);
        assert(turning.prices().size() == 6);
    }

    std::cout << "[TEST] TurningPointSubroutine PASSED\n";
    return 0;
}

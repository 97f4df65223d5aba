#include "strategy/ThresholdControl.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace stratsim;
using stratsim::market::Instrument;
using stratsim::strategy::ThresholdControl;
using stratsim::strategy::ThresholdControlConfig;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}
}

int main() {
    auto logger = Logger::createNull();

    // Winning boundary: gain of exactly 40% of total0 triggers.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 500.0, 50.0, ThresholdControlConfig(), logger);
        assert(near(control.total0(), 1000.0));

        inst.update(1, 18.0);  // total 1400, gain 400
        const double amount = control.update(500.0, 0.0);
        assert(near(amount, -25.0));
        assert(near(control.output(), -25.0));
        assert(near(control.units().back(), 25.0));
        assert(near(control.funds().back(), 500.0 + 25.0 * 18.0));
    }

    // Just under the winning threshold: nothing happens.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 500.0, 50.0, ThresholdControlConfig(), logger);
        inst.update(1, 17.9);
        assert(control.update(500.0, 0.0) == 0.0);
        assert(control.units().size() == 2);
        assert(near(control.units().back(), 50.0));
    }

    // Losing boundary with sellingPerLose = 1 closes the whole holding.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 500.0, 50.0, ThresholdControlConfig(), logger);
        inst.update(1, 6.0);   // total 800, gain -200
        assert(near(control.update(500.0, 0.0), -50.0));
        assert(near(control.units().back(), 0.0));
    }

    // Short holdings are bought back toward zero.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 1500.0, -50.0, ThresholdControlConfig(), logger);
        assert(near(control.total0(), 1000.0));
        inst.update(1, 2.0);   // total 1400, gain 400
        assert(near(control.update(1500.0, 0.0), 25.0));
    }

    // The proposed delta counts toward the evaluated holding.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 1000.0, 0.0, ThresholdControlConfig(), logger);
        inst.update(1, 10.0);
        // unit 50 at price 10 on top of an unchanged fund: gain 500 = 50%
        assert(near(control.update(1000.0, 50.0), -25.0));
    }

    // gain == 0 resolves to the winning branch when both thresholds are zero.
    {
        ThresholdControlConfig config;
        config.winning_per = 0.0;
        config.losing_per = 0.0;
        config.selling_per_win = 0.5;
        config.selling_per_lose = 1.0;

        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 500.0, 50.0, config, logger);
        inst.update(1, 10.0);
        assert(near(control.update(500.0, 0.0), -25.0));
    }

    // Neutral holding suppresses any action and records nothing.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 1000.0, 0.0, ThresholdControlConfig(), logger);
        inst.update(1, 30.0);
        assert(control.update(1000.0, 0.0) == 0.0);
        assert(control.units().size() == 1);
        assert(control.funds().size() == 1);
        assert(control.prices().size() == 1);
    }

    // reset re-anchors the baseline and keeps the configuration.
    {
        ThresholdControlConfig config;
        config.winning_per = 0.1;
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        ThresholdControl control(inst, 500.0, 50.0, config, logger);
        assert(control.resetCount() == 0);

        inst.update(1, 20.0);
        control.reset(400.0, 30.0);
        assert(near(control.total0(), 1000.0));
        assert(control.resetCount() == 1);
        assert(control.units().size() == 1);
        assert(near(control.config().winning_per, 0.1));
    }

    // Percentages above 1 are rejected at construction.
    {
        Instrument inst(1, "Acme", "ACM");
        inst.update(0, 10.0);
        const double bad_values[] = {1.5, -0.1};
        for (double bad : bad_values) {
            for (int field = 0; field < 4; ++field) {
                ThresholdControlConfig config;
                if (field == 0) config.winning_per = bad;
                if (field == 1) config.losing_per = bad;
                if (field == 2) config.selling_per_win = bad;
                if (field == 3) config.selling_per_lose = bad;

                bool threw = false;
                try {
                    ThresholdControl control(inst, 500.0, 50.0, config, logger);
                } catch (const std::invalid_argument&) {
                    threw = true;
                }
                assert(threw);
            }
        }
    }

    std::cout << "[TEST] ThresholdControl PASSED\n";
    return 0;
}

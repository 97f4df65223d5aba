#pragma once

#include "common/Types.h"

namespace stratsim {
namespace strategy {

// Result of feeding one price into a ReversalTracker.
struct PriceMove {
    Trend move = Trend::UNSET;      // UNSET when the price did not change
    bool first = false;             // first observed direction, nothing else to act on
    bool reversed_down = false;     // rising -> falling, previous price became the high
    bool reversed_up = false;       // falling -> rising, previous price became the low

    bool actionable() const { return move != Trend::UNSET && !first; }
};

// Local direction state machine shared by the price-driven subroutines.
//
//   UNSET   --move-->            RISING / FALLING   (first, no extremum)
//   RISING  --fall-->            FALLING            (high = previous price)
//   FALLING --rise-->            RISING             (low = previous price)
//   any     --unchanged price--> same state
class ReversalTracker {
public:
    static constexpr Price INITIAL_HIGH = -10000.0;
    static constexpr Price INITIAL_LOW = 10000.0;

    explicit ReversalTracker(Price initial_price);

    PriceMove observe(Price price);

    Trend direction() const { return direction_; }
    Price high() const { return high_; }
    Price low() const { return low_; }
    Price lastPrice() const { return last_price_; }

private:
    Trend direction_;
    Price high_;
    Price low_;
    Price last_price_;
};

} // namespace strategy
} // namespace stratsim

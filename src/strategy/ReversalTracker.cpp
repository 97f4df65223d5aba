#include "strategy/ReversalTracker.h"

namespace stratsim {
namespace strategy {

ReversalTracker::ReversalTracker(Price initial_price)
    : direction_(Trend::UNSET)
    , high_(INITIAL_HIGH)
    , low_(INITIAL_LOW)
    , last_price_(initial_price)
{
}

PriceMove ReversalTracker::observe(Price price) {
    PriceMove result;
    const Price previous = last_price_;
    last_price_ = price;

    if (price > previous) {
        result.move = Trend::RISING;
    } else if (price < previous) {
        result.move = Trend::FALLING;
    } else {
        return result;
    }

    switch (direction_) {
        case Trend::UNSET:
            result.first = true;
            break;
        case Trend::RISING:
            if (result.move == Trend::FALLING) {
                high_ = previous;
                result.reversed_down = true;
            }
            break;
        case Trend::FALLING:
            if (result.move == Trend::RISING) {
                low_ = previous;
                result.reversed_up = true;
            }
            break;
    }

    direction_ = result.move;
    return result;
}

} // namespace strategy
} // namespace stratsim

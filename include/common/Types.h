#pragma once

#include <string>
#include <vector>

namespace stratsim {

using Timestamp = long long;   // epoch milliseconds
using Price = double;
using Volume = double;
using Amount = double;

enum class InstrumentType { STOCK, FUTURE };

// 가격 방향 (직전 가격 대비)
enum class Trend { UNSET, RISING, FALLING };

// 대기 중인 매매 트리거
enum class ArmState { IDLE, ARMED_BUY, ARMED_SELL };

enum class OrderSource { CHASE, TURNING, THRESHOLD_CONTROL, OTHER };

struct PricePoint {
    Timestamp timestamp;
    Price price;

    PricePoint() : timestamp(0), price(0) {}
    PricePoint(Timestamp t, Price p) : timestamp(t), price(p) {}
};

// Executed order. quantity is what was asked for, filled_quantity what was booked.
struct OrderRecord {
    const Timestamp timestamp;
    const Price price;
    const Volume quantity;
    const Volume filled_quantity;
    const OrderSource source;

    OrderRecord(Timestamp t, Price p, Volume q, Volume filled, OrderSource src)
        : timestamp(t), price(p), quantity(q), filled_quantity(filled), source(src) {}
};

std::string toString(InstrumentType type);
InstrumentType instrumentTypeFromString(const std::string& value);

std::string toString(Trend trend);
std::string toString(ArmState state);

std::string toString(OrderSource source);
OrderSource orderSourceFromString(const std::string& value);

} // namespace stratsim

#pragma once

#include <string>

#include "common/ParameterSet.h"
#include "common/Types.h"

namespace stratsim {
namespace strategy {

enum class ChasingMode {
    CHASE,      // 상승장에서 보유량 확대
    SAFETY      // 추세 중 전환점에서 일정량 청산
};

enum class TurningMode {
    INCREASE,   // buying 증가
    DECREASE,   // selling 증가
    SIZE        // 둘 다 증가
};

enum class PendingSide { BUY, SELL };

std::string toString(ChasingMode mode);
ChasingMode chasingModeFromString(const std::string& value);
std::string toString(TurningMode mode);
TurningMode turningModeFromString(const std::string& value);
std::string toString(PendingSide side);

// All percentages are fractions in [0, 1].
struct ThresholdControlConfig {
    double winning_per = 0.4;       // 기준 대비 수익률 트리거
    double losing_per = 0.2;        // 기준 대비 손실률 트리거
    double selling_per_win = 0.5;   // 수익 시 청산 비율
    double selling_per_lose = 1.0;  // 손실 시 청산 비율

    static ThresholdControlConfig fromParameters(const ParameterSet& params);
    void validate() const;
};

struct ChasingConfig {
    Trend trend = Trend::RISING;    // expected market direction
    ChasingMode mode = ChasingMode::CHASE;
    double gap = 5.0;
    double upper_limit = 1.0;
    double lower_limit = 0.5;
    double init = 50.0;             // first stacked buy size
    double inc = 10.0;              // size decrement per stacked buy
    double safety_amount = 20.0;

    static ChasingConfig fromParameters(const ParameterSet& params);
    void validate() const;
};

struct TurningPointConfig {
    TurningMode mode = TurningMode::INCREASE;
    PendingSide first_side = PendingSide::SELL;
    double n = 10.0;                // initial buying / selling size
    double n_delta = 1.0;
    double h = 1.0;                 // reversal distance that triggers a trade

    static TurningPointConfig fromParameters(const ParameterSet& params);
    void validate() const;
};

} // namespace strategy
} // namespace stratsim

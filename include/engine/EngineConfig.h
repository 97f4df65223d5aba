#pragma once

#include <string>

namespace stratsim {
namespace engine {

// 주 서브루틴 선택
enum class EngineMode {
    CHASE,      // ChasingSubroutine
    TURNING     // TurningPointSubroutine
};

std::string toString(EngineMode mode);
EngineMode engineModeFromString(const std::string& value);

struct InstrumentConfig {
    int id = 0;
    std::string name = "instrument";
    std::string symbol = "SYM";
    std::string type = "stock";
};

// 엔진 설정
struct EngineConfig {
    EngineMode mode;
    double fund;            // 현금
    double unit;            // 보유 수량
    double unit_init;       // Chasing 기준 수량

    EngineConfig()
        : mode(EngineMode::CHASE)
        , fund(10000.0)
        , unit(0.0)
        , unit_init(0.0)
    {}
};

} // namespace engine
} // namespace stratsim

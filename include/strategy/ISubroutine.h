#pragma once

#include <string>

namespace stratsim {
namespace strategy {

// 서브루틴 기본 정보
struct SubroutineInfo {
    std::string name;
    std::string description;
    std::string mode;
};

// Decision unit bound to one instrument.
// Proposals are signed unit amounts: positive buys, negative sells, zero does nothing.
class ISubroutine {
public:
    virtual ~ISubroutine() = default;

    virtual SubroutineInfo getInfo() const = 0;

    // Proposal produced by the most recent update.
    virtual double output() const = 0;
};

// Subroutine driven purely by the instrument's price.
class IPriceSubroutine : public ISubroutine {
public:
    // Reads the instrument's current price and returns this tick's proposal.
    virtual double update() = 0;
};

} // namespace strategy
} // namespace stratsim

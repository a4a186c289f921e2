#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

// Long when the MACD line crosses above its signal line, exit on the reverse cross.
class MacdStrategy : public IStrategy {
public:
    virtual ~MacdStrategy() override = default;

    std::string getName() const override;
    std::string getDescription() const override;
    core::ParameterSet defaultParameters() const override;
    core::ParameterSet resolveParameters(const core::ParameterSet& overrides) const override;
    std::size_t getLookback(const core::ParameterSet& params) const override;
    core::Signal generateSignal(const core::BarWindow& window,
                                const core::ParameterSet& params) const override;
};

} // namespace strategy_engine

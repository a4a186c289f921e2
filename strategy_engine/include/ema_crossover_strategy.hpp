#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

// Long when the fast EMA crosses above the slow EMA, exit on the reverse cross.
class EmaCrossoverStrategy : public IStrategy {
public:
    virtual ~EmaCrossoverStrategy() override = default;

    std::string getName() const override;
    std::string getDescription() const override;
    core::ParameterSet defaultParameters() const override;
    core::ParameterSet resolveParameters(const core::ParameterSet& overrides) const override;
    std::size_t getLookback(const core::ParameterSet& params) const override;
    core::Signal generateSignal(const core::BarWindow& window,
                                const core::ParameterSet& params) const override;
};

} // namespace strategy_engine

#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

// Long when RSI recovers above the oversold level, exit when it falls back from overbought.
class RsiReversalStrategy : public IStrategy {
public:
    virtual ~RsiReversalStrategy() override = default;

    std::string getName() const override;
    std::string getDescription() const override;
    core::ParameterSet defaultParameters() const override;
    core::ParameterSet resolveParameters(const core::ParameterSet& overrides) const override;
    std::size_t getLookback(const core::ParameterSet& params) const override;
    core::Signal generateSignal(const core::BarWindow& window,
                                const core::ParameterSet& params) const override;
};

} // namespace strategy_engine

#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

// Long when the close z-score drops below -z_threshold, exit once it returns to the mean.
class MeanReversionStrategy : public IStrategy {
public:
    virtual ~MeanReversionStrategy() override = default;

    std::string getName() const override;
    std::string getDescription() const override;
    core::ParameterSet defaultParameters() const override;
    core::ParameterSet resolveParameters(const core::ParameterSet& overrides) const override;
    std::size_t getLookback(const core::ParameterSet& params) const override;
    core::Signal generateSignal(const core::BarWindow& window,
                                const core::ParameterSet& params) const override;
};

} // namespace strategy_engine

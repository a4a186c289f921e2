#include "macd_strategy.hpp"
#include "macd_indicator.hpp"
#include "common_types.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

std::string MacdStrategy::getName() const {
    return "macd";
}

std::string MacdStrategy::getDescription() const {
    return "MACD line / signal line crossover";
}

core::ParameterSet MacdStrategy::defaultParameters() const {
    return {{"fast_period", 12.0}, {"slow_period", 26.0}, {"signal_period", 9.0}};
}

core::ParameterSet MacdStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    int fast = integerParameter(params, "fast_period", 2);
    int slow = integerParameter(params, "slow_period", 3);
    integerParameter(params, "signal_period", 1);
    if (fast >= slow) {
        throw core::InvalidParameterError("fast_period", "must be less than slow_period");
    }
    return params;
}

std::size_t MacdStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "slow_period", 3)) +
           static_cast<std::size_t>(integerParameter(params, "signal_period", 1));
}

core::Signal MacdStrategy::generateSignal(const core::BarWindow& window,
                                          const core::ParameterSet& params) const
{
    if (window.size() < getLookback(params)) {
        return core::Signal::hold();
    }

    // Smoothing is seeded from the first bars, so the whole history is used
    indicators::MacdIndicator macd(integerParameter(params, "fast_period", 2),
                                   integerParameter(params, "slow_period", 3),
                                   integerParameter(params, "signal_period", 1));
    macd.calculate(window);

    double macd_now, macd_prev, signal_now, signal_prev;
    if (!indicators::tailValue(macd.getResult(), 0, macd_now) || !indicators::tailValue(macd.getResult(), 1, macd_prev) ||
        !indicators::tailValue(macd.getSignalLine(), 0, signal_now) || !indicators::tailValue(macd.getSignalLine(), 1, signal_prev)) {
        return core::Signal::hold();
    }

    switch (detectCross(macd_prev, signal_prev, macd_now, signal_now)) {
        case CrossType::CrossesAbove: return core::Signal::enterLong();
        case CrossType::CrossesBelow: return core::Signal::exit();
        default:                      return core::Signal::hold();
    }
}

} // namespace strategy_engine

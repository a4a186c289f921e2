#include "sma_crossover_strategy.hpp"
#include "sma_indicator.hpp"
#include "common_types.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

std::string SmaCrossoverStrategy::getName() const {
    return "sma_crossover";
}

std::string SmaCrossoverStrategy::getDescription() const {
    return "Simple moving average crossover (golden/death cross)";
}

core::ParameterSet SmaCrossoverStrategy::defaultParameters() const {
    return {{"fast_period", 20.0}, {"slow_period", 50.0}};
}

core::ParameterSet SmaCrossoverStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    int fast = integerParameter(params, "fast_period", 1);
    int slow = integerParameter(params, "slow_period", 2);
    if (fast >= slow) {
        throw core::InvalidParameterError("fast_period", "must be less than slow_period");
    }
    return params;
}

std::size_t SmaCrossoverStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "slow_period", 2)) + 1;
}

core::Signal SmaCrossoverStrategy::generateSignal(const core::BarWindow& window,
                                                  const core::ParameterSet& params) const
{
    std::size_t lookback = getLookback(params);
    if (window.size() < lookback) {
        return core::Signal::hold();
    }

    // Two values of each average are enough, so only the trailing bars are fed in
    core::BarWindow recent = window.tail(lookback);
    indicators::SmaIndicator fast(integerParameter(params, "fast_period", 1));
    indicators::SmaIndicator slow(integerParameter(params, "slow_period", 2));
    fast.calculate(recent);
    slow.calculate(recent);

    double fast_now, fast_prev, slow_now, slow_prev;
    if (!indicators::tailValue(fast.getResult(), 0, fast_now) || !indicators::tailValue(fast.getResult(), 1, fast_prev) ||
        !indicators::tailValue(slow.getResult(), 0, slow_now) || !indicators::tailValue(slow.getResult(), 1, slow_prev)) {
        return core::Signal::hold();
    }

    switch (detectCross(fast_prev, slow_prev, fast_now, slow_now)) {
        case CrossType::CrossesAbove: return core::Signal::enterLong();
        case CrossType::CrossesBelow: return core::Signal::exit();
        default:                      return core::Signal::hold();
    }
}

} // namespace strategy_engine

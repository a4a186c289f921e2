#include "ema_crossover_strategy.hpp"
#include "ema_indicator.hpp"
#include "common_types.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

std::string EmaCrossoverStrategy::getName() const {
    return "ema_crossover";
}

std::string EmaCrossoverStrategy::getDescription() const {
    return "Exponential moving average crossover";
}

core::ParameterSet EmaCrossoverStrategy::defaultParameters() const {
    return {{"fast_period", 12.0}, {"slow_period", 26.0}};
}

core::ParameterSet EmaCrossoverStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    int fast = integerParameter(params, "fast_period", 2);
    int slow = integerParameter(params, "slow_period", 3);
    if (fast >= slow) {
        throw core::InvalidParameterError("fast_period", "must be less than slow_period");
    }
    return params;
}

std::size_t EmaCrossoverStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "slow_period", 3)) + 1;
}

core::Signal EmaCrossoverStrategy::generateSignal(const core::BarWindow& window,
                                                  const core::ParameterSet& params) const
{
    if (window.size() < getLookback(params)) {
        return core::Signal::hold();
    }

    // EMA values depend on the seed, so the whole history is used
    indicators::EmaIndicator fast(integerParameter(params, "fast_period", 2));
    indicators::EmaIndicator slow(integerParameter(params, "slow_period", 3));
    fast.calculate(window);
    slow.calculate(window);

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

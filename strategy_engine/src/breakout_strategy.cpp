#include "breakout_strategy.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"
#include <algorithm>

namespace strategy_engine {

std::string BreakoutStrategy::getName() const {
    return "breakout";
}

std::string BreakoutStrategy::getDescription() const {
    return "Donchian channel breakout";
}

core::ParameterSet BreakoutStrategy::defaultParameters() const {
    return {{"lookback", 20.0}, {"threshold", 0.0}};
}

core::ParameterSet BreakoutStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    integerParameter(params, "lookback", 1);
    double threshold = numericParameter(params, "threshold");
    if (threshold < 0.0 || threshold >= 100.0) {
        throw core::InvalidParameterError("threshold", "must lie in [0, 100)");
    }
    return params;
}

std::size_t BreakoutStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "lookback", 1)) + 1;
}

core::Signal BreakoutStrategy::generateSignal(const core::BarWindow& window,
                                              const core::ParameterSet& params) const
{
    std::size_t lookback = getLookback(params);
    if (window.size() < lookback) {
        return core::Signal::hold();
    }

    // Channel over the bars before the current one
    core::BarWindow recent = window.tail(lookback);
    double highest = recent[0].high;
    double lowest = recent[0].low;
    for (std::size_t i = 1; i + 1 < recent.size(); ++i) {
        highest = std::max(highest, recent[i].high);
        lowest = std::min(lowest, recent[i].low);
    }

    double margin = params.at("threshold") / 100.0;
    double close = recent.back().close;

    if (close > highest * (1.0 + margin)) {
        return core::Signal::enterLong();
    }
    if (close < lowest * (1.0 - margin)) {
        return core::Signal::exit();
    }
    return core::Signal::hold();
}

} // namespace strategy_engine

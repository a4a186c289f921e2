#include "rsi_reversal_strategy.hpp"
#include "rsi_indicator.hpp"
#include "common_types.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

std::string RsiReversalStrategy::getName() const {
    return "rsi_reversal";
}

std::string RsiReversalStrategy::getDescription() const {
    return "RSI mean reversal out of oversold / overbought zones";
}

core::ParameterSet RsiReversalStrategy::defaultParameters() const {
    return {{"period", 14.0}, {"oversold", 30.0}, {"overbought", 70.0}};
}

core::ParameterSet RsiReversalStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    integerParameter(params, "period", 2);
    double oversold = boundedParameter(params, "oversold", 0.0, 100.0);
    double overbought = boundedParameter(params, "overbought", 0.0, 100.0);
    if (oversold >= overbought) {
        throw core::InvalidParameterError("oversold", "must be less than overbought");
    }
    return params;
}

std::size_t RsiReversalStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "period", 2)) + 2;
}

core::Signal RsiReversalStrategy::generateSignal(const core::BarWindow& window,
                                                 const core::ParameterSet& params) const
{
    if (window.size() < getLookback(params)) {
        return core::Signal::hold();
    }

    // Smoothing is seeded from the first bars, so the whole history is used
    indicators::RsiIndicator rsi(integerParameter(params, "period", 2));
    rsi.calculate(window);

    double rsi_now, rsi_prev;
    if (!indicators::tailValue(rsi.getResult(), 0, rsi_now) || !indicators::tailValue(rsi.getResult(), 1, rsi_prev)) {
        return core::Signal::hold();
    }

    // Entry on the way out of oversold, exit on the way out of overbought
    if (detectCross(rsi_prev, params.at("oversold"), rsi_now, params.at("oversold")) == CrossType::CrossesAbove) {
        return core::Signal::enterLong();
    }
    if (detectCross(rsi_prev, params.at("overbought"), rsi_now, params.at("overbought")) == CrossType::CrossesBelow) {
        return core::Signal::exit();
    }
    return core::Signal::hold();
}

} // namespace strategy_engine

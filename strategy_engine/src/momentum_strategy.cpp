#include "momentum_strategy.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

namespace {

    // Percent change of the close `back_offset` bars from the end over `period` bars
    double rateOfChange(const core::BarWindow& window, std::size_t period, std::size_t back_offset) {
        const core::Bar& now = window[window.size() - 1 - back_offset];
        const core::Bar& then = window[window.size() - 1 - back_offset - period];
        return (now.close - then.close) / then.close * 100.0;
    }

} // namespace

std::string MomentumStrategy::getName() const {
    return "momentum";
}

std::string MomentumStrategy::getDescription() const {
    return "Rate of change momentum";
}

core::ParameterSet MomentumStrategy::defaultParameters() const {
    return {{"period", 14.0}, {"threshold", 5.0}};
}

core::ParameterSet MomentumStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    integerParameter(params, "period", 1);
    if (numericParameter(params, "threshold") < 0.0) {
        throw core::InvalidParameterError("threshold", "must not be negative");
    }
    return params;
}

std::size_t MomentumStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "period", 1)) + 2;
}

core::Signal MomentumStrategy::generateSignal(const core::BarWindow& window,
                                              const core::ParameterSet& params) const
{
    if (window.size() < getLookback(params)) {
        return core::Signal::hold();
    }

    std::size_t period = static_cast<std::size_t>(integerParameter(params, "period", 1));
    double roc_now = rateOfChange(window, period, 0);
    double roc_prev = rateOfChange(window, period, 1);
    double threshold = params.at("threshold");

    if (roc_prev <= threshold && roc_now > threshold) {
        return core::Signal::enterLong();
    }
    if (roc_prev >= 0.0 && roc_now < 0.0) {
        return core::Signal::exit();
    }
    return core::Signal::hold();
}

} // namespace strategy_engine

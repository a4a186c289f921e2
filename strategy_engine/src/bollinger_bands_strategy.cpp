#include "bollinger_bands_strategy.hpp"
#include "bollinger_indicator.hpp"
#include "common_types.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

std::string BollingerBandsStrategy::getName() const {
    return "bollinger_bands";
}

std::string BollingerBandsStrategy::getDescription() const {
    return "Bollinger band breach reversal";
}

core::ParameterSet BollingerBandsStrategy::defaultParameters() const {
    return {{"period", 20.0}, {"std_dev", 2.0}};
}

core::ParameterSet BollingerBandsStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    integerParameter(params, "period", 2);
    if (numericParameter(params, "std_dev") <= 0.0) {
        throw core::InvalidParameterError("std_dev", "must be positive");
    }
    return params;
}

std::size_t BollingerBandsStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "period", 2)) + 1;
}

core::Signal BollingerBandsStrategy::generateSignal(const core::BarWindow& window,
                                                    const core::ParameterSet& params) const
{
    std::size_t lookback = getLookback(params);
    if (window.size() < lookback) {
        return core::Signal::hold();
    }

    core::BarWindow recent = window.tail(lookback);
    indicators::BollingerBandsIndicator bands(integerParameter(params, "period", 2), params.at("std_dev"));
    bands.calculate(recent);

    double upper_now, upper_prev, lower_now, lower_prev;
    if (!indicators::tailValue(bands.getUpperBand(), 0, upper_now) || !indicators::tailValue(bands.getUpperBand(), 1, upper_prev) ||
        !indicators::tailValue(bands.getLowerBand(), 0, lower_now) || !indicators::tailValue(bands.getLowerBand(), 1, lower_prev)) {
        return core::Signal::hold();
    }

    double close_now = recent[recent.size() - 1].close;
    double close_prev = recent[recent.size() - 2].close;

    if (detectCross(close_prev, lower_prev, close_now, lower_now) == CrossType::CrossesBelow) {
        return core::Signal::enterLong();
    }
    if (detectCross(close_prev, upper_prev, close_now, upper_now) == CrossType::CrossesAbove) {
        return core::Signal::exit();
    }
    return core::Signal::hold();
}

} // namespace strategy_engine

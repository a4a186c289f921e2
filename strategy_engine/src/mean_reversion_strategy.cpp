#include "mean_reversion_strategy.hpp"
#include "bollinger_indicator.hpp"
#include "parameters.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

namespace {

    // z-score of the close at `back_offset` against the band built from the same bars.
    // A one-sigma band gives the standard deviation as upper - middle.
    bool zScoreAt(const indicators::BollingerBandsIndicator& bands, const core::BarWindow& window,
                  std::size_t back_offset, double& z)
    {
        double upper, middle;
        if (!indicators::tailValue(bands.getUpperBand(), back_offset, upper) ||
            !indicators::tailValue(bands.getMiddleBand(), back_offset, middle)) {
            return false;
        }
        double std_dev = upper - middle;
        if (!(std_dev > 0.0)) {
            return false;
        }
        z = (window[window.size() - 1 - back_offset].close - middle) / std_dev;
        return true;
    }

} // namespace

std::string MeanReversionStrategy::getName() const {
    return "mean_reversion";
}

std::string MeanReversionStrategy::getDescription() const {
    return "Z-score mean reversion around a rolling mean";
}

core::ParameterSet MeanReversionStrategy::defaultParameters() const {
    return {{"period", 20.0}, {"z_threshold", 2.0}};
}

core::ParameterSet MeanReversionStrategy::resolveParameters(const core::ParameterSet& overrides) const {
    core::ParameterSet params = mergeParameters(getName(), defaultParameters(), overrides);
    integerParameter(params, "period", 2);
    if (numericParameter(params, "z_threshold") <= 0.0) {
        throw core::InvalidParameterError("z_threshold", "must be positive");
    }
    return params;
}

std::size_t MeanReversionStrategy::getLookback(const core::ParameterSet& params) const {
    return static_cast<std::size_t>(integerParameter(params, "period", 2)) + 1;
}

core::Signal MeanReversionStrategy::generateSignal(const core::BarWindow& window,
                                                   const core::ParameterSet& params) const
{
    std::size_t lookback = getLookback(params);
    if (window.size() < lookback) {
        return core::Signal::hold();
    }

    core::BarWindow recent = window.tail(lookback);
    indicators::BollingerBandsIndicator bands(integerParameter(params, "period", 2), 1.0);
    bands.calculate(recent);

    // Flat history has no defined z-score
    double z_now, z_prev;
    if (!zScoreAt(bands, recent, 0, z_now) || !zScoreAt(bands, recent, 1, z_prev)) {
        return core::Signal::hold();
    }

    double z_threshold = params.at("z_threshold");
    if (z_prev >= -z_threshold && z_now < -z_threshold) {
        return core::Signal::enterLong();
    }
    if (z_prev < 0.0 && z_now >= 0.0) {
        return core::Signal::exit();
    }
    return core::Signal::hold();
}

} // namespace strategy_engine

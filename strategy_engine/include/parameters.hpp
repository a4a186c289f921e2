#pragma once

#include "datatypes.hpp"
#include <string>

namespace strategy_engine {

    // Defaults overlaid with overrides. An override whose name is not among the
    // defaults throws core::InvalidParameterError.
    core::ParameterSet mergeParameters(const std::string& strategy_name,
                                       const core::ParameterSet& defaults,
                                       const core::ParameterSet& overrides);

    // Finite numeric value. Throws core::InvalidParameterError if missing or NaN/inf.
    double numericParameter(const core::ParameterSet& params, const std::string& name);

    // Whole number >= min_value. Throws core::InvalidParameterError otherwise.
    int integerParameter(const core::ParameterSet& params, const std::string& name, int min_value = 1);

    // lower < value < upper (exclusive). Throws core::InvalidParameterError otherwise.
    double boundedParameter(const core::ParameterSet& params, const std::string& name,
                            double lower, double upper);

    // "fast_period=20, slow_period=50"
    std::string formatParameters(const core::ParameterSet& params);

} // namespace strategy_engine

#pragma once

#include "datatypes.hpp"    // Needs TimeSeries
#include "price_series.hpp" // Needs BarWindow
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    virtual int getLookback() const = 0;

    // Calculate the indicator over the close prices of the window and store
    // the result internally. Throws core::IndicatorCalculationException if
    // TA-Lib reports an error.
    virtual void calculate(const core::BarWindow& input) = 0;

    // Results aligned so that getResult()[j] belongs to input bar j + getLookback().
    // Empty if the input was not longer than the lookback.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Convenience for the common "current vs previous value" checks.
// `back_offset` 0 is the newest value. Returns false if not enough values.
bool tailValue(const core::TimeSeries<double>& series, std::size_t back_offset, double& out);

} // namespace indicators

#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// MACD line (fast EMA - slow EMA), its signal EMA and the histogram.
// getResult() returns the MACD line.
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::BarWindow& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getSignalLine() const { return signal_; }
    const core::TimeSeries<double>& getHistogram() const { return histogram_; }

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators

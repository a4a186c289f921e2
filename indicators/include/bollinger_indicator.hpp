#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// SMA middle band with bands `num_std_dev` population standard deviations away.
// getResult() returns the middle band.
class BollingerBandsIndicator : public IIndicator {
public:
    BollingerBandsIndicator(int period, double num_std_dev);

    virtual ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::BarWindow& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getUpperBand() const { return upper_; }
    const core::TimeSeries<double>& getMiddleBand() const { return middle_; }
    const core::TimeSeries<double>& getLowerBand() const { return lower_; }

private:
    const int period_;
    const double num_std_dev_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators

#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Exponential moving average, seeded by TA-Lib with the SMA of the first period
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    virtual ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::BarWindow& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators

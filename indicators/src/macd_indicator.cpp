#include "macd_indicator.hpp"
#include "ta_support.hpp"
#include <vector>
#include <stdexcept>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period),
      slow_period_(slow_period),
      signal_period_(signal_period),
      lookback_(0)
{
    if (fast_period_ < 2 || slow_period_ < 2 || signal_period_ < 1) {
        throw std::invalid_argument("MACD periods must be positive (fast/slow at least 2).");
    }
    // TA-Lib silently swaps the two; reject instead
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than slow period.");
    }

    detail::ensureInitialized();
    lookback_ = detail::checkLookback(TA_MACD_Lookback(fast_period_, slow_period_, signal_period_), "TA_MACD_Lookback");
    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_;
}

void MacdIndicator::calculate(const core::BarWindow& input) {
    macd_.clear();
    signal_.clear();
    histogram_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = detail::closePrices(input);
    size_t output_size = close_prices.size() - static_cast<size_t>(lookback_);
    macd_.resize(output_size);
    signal_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd_.data(),
        signal_.data(),
        histogram_.data()
    );

    int produced = detail::checkTaResult(ret_code, "TA_MACD", name_, out_begin_idx, out_nb_element, lookback_);
    macd_.resize(produced);
    signal_.resize(produced);
    histogram_.resize(produced);
}

} // namespace indicators

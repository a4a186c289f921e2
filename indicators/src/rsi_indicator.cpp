#include "rsi_indicator.hpp"
#include "ta_support.hpp"
#include <vector>
#include <stdexcept>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("RSI period must be at least 2.");
    }

    detail::ensureInitialized();
    lookback_ = detail::checkLookback(TA_RSI_Lookback(period_), "TA_RSI_Lookback");
    name_ = fmt::format("RSI({})", period_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::BarWindow& input) {
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = detail::closePrices(input);
    results_.resize(close_prices.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    // Wilder smoothing; a window without any price change yields 0
    TA_RetCode ret_code = TA_RSI(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    int produced = detail::checkTaResult(ret_code, "TA_RSI", name_, out_begin_idx, out_nb_element, lookback_);
    results_.resize(produced);
}

} // namespace indicators

#include "sma_indicator.hpp"
#include "ta_support.hpp"
#include <vector>
#include <stdexcept>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }

    detail::ensureInitialized();
    lookback_ = detail::checkLookback(TA_MA_Lookback(period_, TA_MAType_SMA), "TA_MA_Lookback");
    name_ = fmt::format("SMA({})", period_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::BarWindow& input) {
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return; // Not enough data to calculate anything
    }

    std::vector<double> close_prices = detail::closePrices(input);

    // TA-Lib output size = input size - lookback
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                         // startIdx
        static_cast<int>(close_prices.size()) - 1, // endIdx
        close_prices.data(),
        period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    int produced = detail::checkTaResult(ret_code, "TA_MA", name_, out_begin_idx, out_nb_element, lookback_);
    results_.resize(produced);
}

} // namespace indicators

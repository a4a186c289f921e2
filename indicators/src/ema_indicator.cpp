#include "ema_indicator.hpp"
#include "ta_support.hpp"
#include <vector>
#include <stdexcept>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("EMA period must be positive.");
    }

    detail::ensureInitialized();
    lookback_ = detail::checkLookback(TA_MA_Lookback(period_, TA_MAType_EMA), "TA_MA_Lookback");
    name_ = fmt::format("EMA({})", period_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::BarWindow& input) {
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
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
        TA_MAType_EMA,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    int produced = detail::checkTaResult(ret_code, "TA_MA", name_, out_begin_idx, out_nb_element, lookback_);
    results_.resize(produced);
}

} // namespace indicators

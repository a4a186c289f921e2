#include "bollinger_indicator.hpp"
#include "ta_support.hpp"
#include <vector>
#include <stdexcept>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double num_std_dev)
    : period_(period), num_std_dev_(num_std_dev), lookback_(0)
{
    if (period_ < 2) {
        throw std::invalid_argument("Bollinger period must be at least 2.");
    }
    if (!(num_std_dev_ > 0.0)) {
        throw std::invalid_argument("Bollinger band width must be a positive number of standard deviations.");
    }

    detail::ensureInitialized();
    lookback_ = detail::checkLookback(
        TA_BBANDS_Lookback(period_, num_std_dev_, num_std_dev_, TA_MAType_SMA), "TA_BBANDS_Lookback");
    name_ = fmt::format("BBANDS({},{})", period_, num_std_dev_);
}

std::string BollingerBandsIndicator::getName() const {
    return name_;
}

int BollingerBandsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

void BollingerBandsIndicator::calculate(const core::BarWindow& input) {
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = detail::closePrices(input);
    size_t output_size = close_prices.size() - static_cast<size_t>(lookback_);
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        num_std_dev_,   // optInNbDevUp
        num_std_dev_,   // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    int produced = detail::checkTaResult(ret_code, "TA_BBANDS", name_, out_begin_idx, out_nb_element, lookback_);
    upper_.resize(produced);
    middle_.resize(produced);
    lower_.resize(produced);
}

} // namespace indicators

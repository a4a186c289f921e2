#include "indicators.hpp"
#include "ta_support.hpp"
#include <mutex>

namespace indicators {

namespace detail {

    void ensureInitialized() {
        static std::once_flag once;
        static TA_RetCode init_result = TA_SUCCESS;
        std::call_once(once, [] { init_result = TA_Initialize(); });
        if (init_result != TA_SUCCESS) {
            throw core::IndicatorCalculationException(fmt::format(
                "TA_Initialize failed with error code {}", static_cast<int>(init_result)));
        }
    }

} // namespace detail

bool tailValue(const core::TimeSeries<double>& series, std::size_t back_offset, double& out) {
    if (series.size() <= back_offset) {
        return false;
    }
    out = series[series.size() - 1 - back_offset];
    return true;
}

} // namespace indicators

#pragma once

// Shared plumbing for the TA-Lib backed indicators. Not installed.

#include "price_series.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

namespace indicators {
namespace detail {

    // TA_Initialize once per process. Throws core::IndicatorCalculationException on failure.
    void ensureInitialized();

    inline std::vector<double> closePrices(const core::BarWindow& input) {
        return input.closes();
    }

    // Converts a failed TA-Lib call into an exception and checks alignment.
    // Returns the number of elements TA-Lib produced.
    inline int checkTaResult(TA_RetCode ret_code,
                             const std::string& function_name,
                             const std::string& indicator_name,
                             int out_begin_idx,
                             int out_nb_element,
                             int expected_lookback)
    {
        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(fmt::format(
                "TA-Lib {} failed for {} with error code {}", function_name, indicator_name, static_cast<int>(ret_code)));
        }
        if (out_nb_element > 0 && out_begin_idx != expected_lookback) {
            core::logging::getLogger()->warn(
                "{} out_begin_idx ({}) does not match lookback ({}) for {}. Results might be misaligned.",
                function_name, out_begin_idx, expected_lookback, indicator_name);
        }
        return out_nb_element;
    }

    inline int checkLookback(int lookback, const std::string& function_name) {
        if (lookback < 0) {
            throw core::IndicatorCalculationException(fmt::format(
                "{} returned an unexpected value: {}", function_name, lookback));
        }
        return lookback;
    }

} // namespace detail
} // namespace indicators

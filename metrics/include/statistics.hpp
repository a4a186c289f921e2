#pragma once

#include <vector>
#include <optional>

namespace metrics {
namespace stats {

    // All helpers return std::nullopt when the statistic is undefined for the input.

    std::optional<double> mean(const std::vector<double>& values);

    // Sample (n - 1) standard deviation; needs at least two values
    std::optional<double> sampleStdDev(const std::vector<double>& values);

    // Empirical quantile with linear interpolation between order statistics.
    // `q` must lie in [0, 1].
    std::optional<double> quantile(std::vector<double> values, double q);

} // namespace stats
} // namespace metrics

#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace metrics {
namespace stats {

    std::optional<double> mean(const std::vector<double>& values) {
        if (values.empty()) {
            return std::nullopt;
        }
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    std::optional<double> sampleStdDev(const std::vector<double>& values) {
        if (values.size() < 2) {
            return std::nullopt;
        }
        double m = *mean(values);
        double sum_sq = 0.0;
        for (double v : values) {
            sum_sq += (v - m) * (v - m);
        }
        return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
    }

    std::optional<double> quantile(std::vector<double> values, double q) {
        if (q < 0.0 || q > 1.0) {
            throw std::invalid_argument("Quantile must lie in [0, 1].");
        }
        if (values.empty()) {
            return std::nullopt;
        }
        std::sort(values.begin(), values.end());
        double position = q * static_cast<double>(values.size() - 1);
        std::size_t lower = static_cast<std::size_t>(std::floor(position));
        std::size_t upper = std::min(lower + 1, values.size() - 1);
        double weight = position - static_cast<double>(lower);
        return values[lower] + weight * (values[upper] - values[lower]);
    }

} // namespace stats
} // namespace metrics

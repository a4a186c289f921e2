#pragma once

#include <string>
#include "performance_metrics.hpp"

namespace optimizer {

    // Metrics the optimizer can rank by. Larger is always better.
    enum class Objective {
        TotalReturn,
        Cagr,
        SharpeRatio,
        SortinoRatio,
        CalmarRatio,
        MaxDrawdown, // Non-positive, so the shallowest drawdown wins
        WinRate,
        ProfitFactor,
        Expectancy
    };

    std::string toString(Objective objective);

    // Throws core::InvalidParameterError("objective", ...) for unknown names
    Objective objectiveFromString(const std::string& name);

    metrics::MetricValue objectiveValue(Objective objective, const metrics::PerformanceMetrics& metrics);

} // namespace optimizer

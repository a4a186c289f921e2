#pragma once

#include <vector>

#include "datatypes.hpp"
#include "backtest_result.hpp"
#include "performance_metrics.hpp"

namespace metrics {

    // Derives return, risk and trade statistics. Holds only its config, so
    // compute() may be called concurrently.
    class MetricsEngine {
    public:
        MetricsEngine() = default;
        // Throws core::InvalidParameterError if the config is invalid
        explicit MetricsEngine(MetricsConfig config);

        const MetricsConfig& getConfig() const { return config_; }

        PerformanceMetrics compute(const backtester::BacktestResult& result) const;

        PerformanceMetrics compute(const std::vector<core::Trade>& trades,
                                   const std::vector<core::EquityPoint>& equity_curve,
                                   double initial_capital) const;

        // Simple returns of consecutive equity points; a point with
        // non-positive base equity yields no return.
        static std::vector<double> periodicReturns(const std::vector<core::EquityPoint>& equity_curve);

    private:
        MetricsConfig config_;

        void computeReturnMetrics(PerformanceMetrics& out,
                                  const std::vector<core::EquityPoint>& equity_curve) const;
        void computeDrawdownMetrics(PerformanceMetrics& out,
                                    const std::vector<core::EquityPoint>& equity_curve) const;
        void computeTradeMetrics(PerformanceMetrics& out,
                                 const std::vector<core::Trade>& trades) const;
    };

} // namespace metrics

#pragma once

#include <map>
#include <optional>
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace metrics {

    using json = nlohmann::json;

    // std::nullopt means undefined (e.g. a ratio with a zero denominator and
    // zero numerator). +infinity is a legitimate value (e.g. no losing trades).
    using MetricValue = std::optional<double>;

    struct MetricsConfig {
        double periods_per_year = 252.0;
        double risk_free_rate = 0.02;     // Annual
        double confidence_level = 0.95;   // For VaR / CVaR

        // Throws core::InvalidParameterError
        void validate() const;

        // Missing keys keep their defaults. Throws core::ConfigException on
        // wrong JSON types and core::InvalidParameterError on bad values.
        static MetricsConfig fromJson(const json& j);
        json toJson() const;
    };

    // --- Performance Metrics Struct ---
    // Returns and rates are fractions (0.05 == 5%).
    struct PerformanceMetrics {
        double initial_capital = 0.0;
        double final_equity = 0.0;
        double net_profit = 0.0;

        // Returns
        MetricValue total_return;
        MetricValue cagr;
        MetricValue annualized_volatility;

        // Risk adjusted
        MetricValue sharpe_ratio;
        MetricValue sortino_ratio;
        MetricValue calmar_ratio;

        // Drawdown
        double max_drawdown = 0.0;              // In [-1, 0]
        std::size_t max_drawdown_duration = 0;  // Longest underwater run, in bars
        std::size_t bars_since_peak = 0;        // Current underwater run at the last bar
        MetricValue ulcer_index;

        // Tail risk of periodic returns
        MetricValue value_at_risk;
        MetricValue conditional_value_at_risk;

        // Trade statistics
        std::size_t total_trades = 0;
        std::size_t winning_trades = 0;
        std::size_t losing_trades = 0;
        MetricValue win_rate;
        MetricValue profit_factor;
        MetricValue expectancy;
        MetricValue average_win;
        MetricValue average_loss;   // Negative
        std::size_t max_consecutive_wins = 0;
        std::size_t max_consecutive_losses = 0;
        MetricValue average_holding_bars;
        MetricValue average_holding_days;
        std::map<std::string, std::size_t> exit_reason_counts;

        // Helper method to log calculated metrics
        void logMetrics() const;

        // Undefined values become null, infinite values the string "inf"
        json toJson() const;
    };

    // "n/a", "inf" or the value with `precision` decimals, scaled by `scale`
    std::string formatMetric(const MetricValue& value, int precision = 2, double scale = 1.0);

    // JSON encoding used for every MetricValue in exports
    json metricToJson(const MetricValue& value);

} // namespace metrics

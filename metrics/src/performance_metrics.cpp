#include "performance_metrics.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace metrics {

    namespace {

        double readNumber(const json& j, const char* key, double fallback) {
            if (!j.contains(key) || j[key].is_null()) {
                return fallback;
            }
            if (!j[key].is_number()) {
                throw core::ConfigException(fmt::format("Metrics config field '{}' must be a number.", key));
            }
            return j[key].get<double>();
        }

    } // namespace

    void MetricsConfig::validate() const {
        if (!std::isfinite(periods_per_year) || periods_per_year <= 0.0) {
            throw core::InvalidParameterError("periods_per_year", fmt::format("must be positive, got {}", periods_per_year));
        }
        if (!std::isfinite(risk_free_rate)) {
            throw core::InvalidParameterError("risk_free_rate", fmt::format("must be finite, got {}", risk_free_rate));
        }
        if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
            throw core::InvalidParameterError("confidence_level", fmt::format("must lie in (0, 1), got {}", confidence_level));
        }
    }

    MetricsConfig MetricsConfig::fromJson(const json& j) {
        if (!j.is_object()) {
            throw core::ConfigException("Metrics config must be a JSON object.");
        }
        MetricsConfig config;
        config.periods_per_year = readNumber(j, "periods_per_year", config.periods_per_year);
        config.risk_free_rate = readNumber(j, "risk_free_rate", config.risk_free_rate);
        config.confidence_level = readNumber(j, "confidence_level", config.confidence_level);
        config.validate();
        return config;
    }

    json MetricsConfig::toJson() const {
        return json{
            {"periods_per_year", periods_per_year},
            {"risk_free_rate", risk_free_rate},
            {"confidence_level", confidence_level}
        };
    }

    std::string formatMetric(const MetricValue& value, int precision, double scale) {
        if (!value || std::isnan(*value)) {
            return "n/a";
        }
        if (std::isinf(*value)) {
            return *value > 0 ? "inf" : "-inf";
        }
        return fmt::format("{:.{}f}", *value * scale, precision);
    }

    json metricToJson(const MetricValue& value) {
        if (!value || std::isnan(*value)) {
            return nullptr;
        }
        if (std::isinf(*value)) {
            return *value > 0 ? "inf" : "-inf";
        }
        return *value;
    }

    void PerformanceMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Final Equity: {:.2f} (net {:+.2f})", final_equity, net_profit);
        logger->info("Total Return: {}%", formatMetric(total_return, 2, 100.0));
        logger->info("CAGR: {}%", formatMetric(cagr, 2, 100.0));
        logger->info("Volatility: {}%", formatMetric(annualized_volatility, 2, 100.0));
        logger->info("Sharpe: {}  Sortino: {}  Calmar: {}",
            formatMetric(sharpe_ratio), formatMetric(sortino_ratio), formatMetric(calmar_ratio));
        logger->info("Max Drawdown: {:.2f}% (longest {} bars, {} bars since peak)",
            max_drawdown * 100.0, max_drawdown_duration, bars_since_peak);
        logger->info("Ulcer Index: {}", formatMetric(ulcer_index, 4));
        logger->info("VaR: {}%  CVaR: {}%",
            formatMetric(value_at_risk, 2, 100.0), formatMetric(conditional_value_at_risk, 2, 100.0));
        logger->info("Trades: {} ({} won, {} lost)", total_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {}%", formatMetric(win_rate, 2, 100.0));
        logger->info("Profit Factor: {}", formatMetric(profit_factor));
        logger->info("Expectancy: {}", formatMetric(expectancy));
        logger->info("Avg Win: {}  Avg Loss: {}", formatMetric(average_win), formatMetric(average_loss));
        logger->info("Max Consecutive Wins/Losses: {}/{}", max_consecutive_wins, max_consecutive_losses);
        logger->info("Avg Holding: {} bars ({} days)", formatMetric(average_holding_bars, 1), formatMetric(average_holding_days, 1));
        logger->info("------------------------");
    }

    json PerformanceMetrics::toJson() const {
        json j;
        j["initial_capital"] = initial_capital;
        j["final_equity"] = final_equity;
        j["net_profit"] = net_profit;
        j["total_return"] = metricToJson(total_return);
        j["cagr"] = metricToJson(cagr);
        j["annualized_volatility"] = metricToJson(annualized_volatility);
        j["sharpe_ratio"] = metricToJson(sharpe_ratio);
        j["sortino_ratio"] = metricToJson(sortino_ratio);
        j["calmar_ratio"] = metricToJson(calmar_ratio);
        j["max_drawdown"] = max_drawdown;
        j["max_drawdown_duration"] = max_drawdown_duration;
        j["bars_since_peak"] = bars_since_peak;
        j["ulcer_index"] = metricToJson(ulcer_index);
        j["value_at_risk"] = metricToJson(value_at_risk);
        j["conditional_value_at_risk"] = metricToJson(conditional_value_at_risk);
        j["total_trades"] = total_trades;
        j["winning_trades"] = winning_trades;
        j["losing_trades"] = losing_trades;
        j["win_rate"] = metricToJson(win_rate);
        j["profit_factor"] = metricToJson(profit_factor);
        j["expectancy"] = metricToJson(expectancy);
        j["average_win"] = metricToJson(average_win);
        j["average_loss"] = metricToJson(average_loss);
        j["max_consecutive_wins"] = max_consecutive_wins;
        j["max_consecutive_losses"] = max_consecutive_losses;
        j["average_holding_bars"] = metricToJson(average_holding_bars);
        j["average_holding_days"] = metricToJson(average_holding_days);
        j["exit_reason_counts"] = exit_reason_counts;
        return j;
    }

} // namespace metrics

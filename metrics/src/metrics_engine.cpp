#include "metrics_engine.hpp"
#include "statistics.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <utility>

namespace metrics {

    namespace {

        constexpr double kInfinity = std::numeric_limits<double>::infinity();

    } // namespace

    MetricsEngine::MetricsEngine(MetricsConfig config) : config_(std::move(config)) {
        config_.validate();
    }

    std::vector<double> MetricsEngine::periodicReturns(const std::vector<core::EquityPoint>& equity_curve) {
        std::vector<double> returns;
        if (equity_curve.size() < 2) {
            return returns;
        }
        returns.reserve(equity_curve.size() - 1);
        for (std::size_t i = 1; i < equity_curve.size(); ++i) {
            double base = equity_curve[i - 1].equity;
            if (base <= 0.0) {
                continue;
            }
            returns.push_back(equity_curve[i].equity / base - 1.0);
        }
        return returns;
    }

    PerformanceMetrics MetricsEngine::compute(const backtester::BacktestResult& result) const {
        return compute(result.trades, result.equity_curve, result.initial_capital);
    }

    PerformanceMetrics MetricsEngine::compute(const std::vector<core::Trade>& trades,
                                              const std::vector<core::EquityPoint>& equity_curve,
                                              double initial_capital) const
    {
        config_.validate();

        PerformanceMetrics out;
        out.initial_capital = initial_capital;
        out.final_equity = equity_curve.empty() ? initial_capital : equity_curve.back().equity;
        out.net_profit = out.final_equity - initial_capital;

        computeReturnMetrics(out, equity_curve);
        computeDrawdownMetrics(out, equity_curve);
        computeTradeMetrics(out, trades);

        // Calmar needs both CAGR and drawdown
        if (out.cagr) {
            if (out.max_drawdown < 0.0) {
                out.calmar_ratio = *out.cagr / std::abs(out.max_drawdown);
            } else if (*out.cagr > 0.0) {
                out.calmar_ratio = kInfinity;
            }
        }
        return out;
    }

    void MetricsEngine::computeReturnMetrics(PerformanceMetrics& out,
                                             const std::vector<core::EquityPoint>& equity_curve) const
    {
        if (out.initial_capital > 0.0) {
            out.total_return = out.final_equity / out.initial_capital - 1.0;
        }

        if (equity_curve.size() >= 2 && out.initial_capital > 0.0) {
            double years = core::utils::yearsBetween(equity_curve.front().timestamp, equity_curve.back().timestamp);
            if (years > 0.0) {
                double growth = out.final_equity / out.initial_capital;
                out.cagr = growth > 0.0 ? std::pow(growth, 1.0 / years) - 1.0 : -1.0;
            }
        }

        std::vector<double> returns = periodicReturns(equity_curve);
        const double periods = config_.periods_per_year;
        const double rf_per_period = config_.risk_free_rate / periods;

        auto std_dev = stats::sampleStdDev(returns);
        if (std_dev) {
            out.annualized_volatility = *std_dev * std::sqrt(periods);
        }

        auto mean_return = stats::mean(returns);
        if (mean_return && std_dev && *std_dev > 0.0) {
            out.sharpe_ratio = (*mean_return - rf_per_period) / *std_dev * std::sqrt(periods);
        }

        if (returns.size() >= 2) {
            double mean_excess = *mean_return - rf_per_period;
            std::vector<double> downside;
            for (double r : returns) {
                if (r < 0.0) downside.push_back(r);
            }
            auto downside_std = stats::sampleStdDev(downside);
            if (downside_std && *downside_std > 0.0) {
                out.sortino_ratio = mean_excess / *downside_std * std::sqrt(periods);
            } else if (downside.empty() && mean_excess > 0.0) {
                out.sortino_ratio = kInfinity;
            }
        }

        auto var = stats::quantile(returns, 1.0 - config_.confidence_level);
        if (var) {
            out.value_at_risk = var;
            std::vector<double> tail;
            for (double r : returns) {
                if (r <= *var) tail.push_back(r);
            }
            out.conditional_value_at_risk = stats::mean(tail);
        }
    }

    void MetricsEngine::computeDrawdownMetrics(PerformanceMetrics& out,
                                               const std::vector<core::EquityPoint>& equity_curve) const
    {
        if (equity_curve.empty()) {
            return;
        }

        double peak = out.initial_capital > 0.0 ? out.initial_capital : equity_curve.front().equity;
        double max_dd = 0.0;
        double sum_sq = 0.0;
        std::size_t run = 0;
        std::size_t longest = 0;

        for (const auto& point : equity_curve) {
            peak = std::max(peak, point.equity);
            double dd = peak > 0.0 ? (point.equity - peak) / peak : 0.0;
            dd = std::max(dd, -1.0);
            max_dd = std::min(max_dd, dd);
            sum_sq += dd * dd;

            if (dd < 0.0) {
                ++run;
                longest = std::max(longest, run);
            } else {
                run = 0;
            }
        }

        out.max_drawdown = max_dd;
        out.max_drawdown_duration = longest;
        out.bars_since_peak = run;
        out.ulcer_index = std::sqrt(sum_sq / static_cast<double>(equity_curve.size()));
    }

    void MetricsEngine::computeTradeMetrics(PerformanceMetrics& out,
                                            const std::vector<core::Trade>& trades) const
    {
        out.total_trades = trades.size();
        for (const auto& trade : trades) {
            out.exit_reason_counts[core::toString(trade.exit_reason)]++;
        }
        if (trades.empty()) {
            return;
        }

        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double net_sum = 0.0;
        double bar_sum = 0.0;
        double day_sum = 0.0;
        std::size_t win_run = 0;
        std::size_t loss_run = 0;

        for (const auto& trade : trades) {
            net_sum += trade.net_pnl;
            bar_sum += static_cast<double>(trade.exit_index - trade.entry_index);
            day_sum += std::chrono::duration<double>(trade.exit_time - trade.entry_time).count() / 86400.0;

            if (trade.net_pnl > 0.0) {
                out.winning_trades++;
                gross_profit += trade.net_pnl;
                ++win_run;
                loss_run = 0;
            } else if (trade.net_pnl < 0.0) {
                out.losing_trades++;
                gross_loss += trade.net_pnl;
                ++loss_run;
                win_run = 0;
            } else {
                win_run = 0;
                loss_run = 0;
            }
            out.max_consecutive_wins = std::max(out.max_consecutive_wins, win_run);
            out.max_consecutive_losses = std::max(out.max_consecutive_losses, loss_run);
        }

        double count = static_cast<double>(trades.size());
        out.win_rate = static_cast<double>(out.winning_trades) / count;
        out.expectancy = net_sum / count;
        out.average_holding_bars = bar_sum / count;
        out.average_holding_days = day_sum / count;

        if (out.winning_trades > 0) {
            out.average_win = gross_profit / static_cast<double>(out.winning_trades);
        }
        if (out.losing_trades > 0) {
            out.average_loss = gross_loss / static_cast<double>(out.losing_trades);
            out.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 0.0) {
            out.profit_factor = kInfinity;
        }
    }

} // namespace metrics

#include "execution_simulator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <utility>

namespace backtester {

    namespace {

        bool isBelow(double level, double reference, bool is_long) {
            return is_long ? level < reference : level > reference;
        }

        // Signal level if it sits on the protective side of the entry, else the config distance
        std::optional<double> resolveLevel(std::optional<double> signal_level,
                                           std::optional<double> fraction,
                                           double entry_market_price,
                                           bool is_long,
                                           bool is_stop,
                                           const char* label,
                                           std::size_t bar_index)
        {
            if (signal_level) {
                bool valid = is_stop ? isBelow(*signal_level, entry_market_price, is_long)
                                     : isBelow(entry_market_price, *signal_level, is_long);
                if (valid) {
                    return signal_level;
                }
                core::logging::getLogger()->warn(
                    "Bar {}: discarding {} {:.4f} on the wrong side of entry price {:.4f}.",
                    bar_index, label, *signal_level, entry_market_price);
            }
            if (fraction) {
                double sign = (is_long == is_stop) ? -1.0 : 1.0;
                return entry_market_price * (1.0 + sign * *fraction);
            }
            return std::nullopt;
        }

    } // namespace

    ExecutionSimulator::ExecutionSimulator(BacktestConfig config) : config_(std::move(config)) {
        config_.validate();
    }

    BacktestResult ExecutionSimulator::run(const core::PriceSeries& series,
                                           const strategy_engine::IStrategy& strategy,
                                           const core::ParameterSet& params) const
    {
        return simulate(series, strategy, params, config_);
    }

    BacktestResult ExecutionSimulator::run(const core::PriceSeries& series,
                                           const strategy_engine::IStrategy& strategy,
                                           const core::ParameterSet& params,
                                           double initial_capital,
                                           double commission_rate,
                                           double slippage_rate) const
    {
        BacktestConfig config = config_;
        config.initial_capital = initial_capital;
        config.commission_rate = commission_rate;
        config.slippage_rate = slippage_rate;
        return simulate(series, strategy, params, config);
    }

    std::optional<core::ExitReason> ExecutionSimulator::checkRiskExit(const core::Position& position,
                                                                      const core::Bar& bar,
                                                                      RiskExitPriority priority) const
    {
        bool is_long = position.side == core::PositionSide::Long;
        bool stop_hit = position.stop_loss &&
            (is_long ? bar.low <= *position.stop_loss : bar.high >= *position.stop_loss);
        bool target_hit = position.take_profit &&
            (is_long ? bar.high >= *position.take_profit : bar.low <= *position.take_profit);

        if (stop_hit && target_hit) {
            return priority == RiskExitPriority::StopLossFirst ? core::ExitReason::StopLoss
                                                               : core::ExitReason::TakeProfit;
        }
        if (stop_hit) return core::ExitReason::StopLoss;
        if (target_hit) return core::ExitReason::TakeProfit;
        return std::nullopt;
    }

    void ExecutionSimulator::openFromSignal(Portfolio& portfolio,
                                            const core::Signal& signal,
                                            const core::Bar& bar,
                                            std::size_t bar_index,
                                            const BacktestConfig& config) const
    {
        bool is_long = signal.action == core::SignalAction::EnterLong;
        double entry = bar.close;
        auto stop = resolveLevel(signal.stop_loss_price, config.stop_loss_fraction,
                                 entry, is_long, true, "stop loss", bar_index);
        auto target = resolveLevel(signal.take_profit_price, config.take_profit_fraction,
                                   entry, is_long, false, "take profit", bar_index);

        if (!(portfolio.getEquity(entry) > 0.0)) {
            core::logging::getLogger()->warn("Bar {}: equity exhausted, ignoring {} signal.",
                bar_index, core::toString(signal.action));
            return;
        }
        portfolio.openPosition(is_long ? core::PositionSide::Long : core::PositionSide::Short,
                               bar.timestamp, bar_index, entry, config.max_position_fraction, stop, target);
    }

    BacktestResult ExecutionSimulator::simulate(const core::PriceSeries& series,
                                                const strategy_engine::IStrategy& strategy,
                                                const core::ParameterSet& params,
                                                const BacktestConfig& config) const
    {
        auto logger = core::logging::getLogger();

        config.validate();
        series.validate();
        core::ParameterSet resolved = strategy.resolveParameters(params);
        std::size_t lookback = strategy.getLookback(resolved);
        if (series.size() < lookback || series.empty()) {
            throw core::InsufficientDataError(lookback == 0 ? 1 : lookback, series.size());
        }

        logger->debug("Simulating '{}' on {} {} ({} bars, lookback {}).",
            strategy.getName(), series.getSymbol(), series.getInterval(), series.size(), lookback);

        Portfolio portfolio(config.initial_capital, CostModel{config.commission_rate, config.slippage_rate});
        const std::size_t last = series.size() - 1;

        for (std::size_t i = 0; i <= last; ++i) {
            const core::Bar& bar = series[i];
            bool forced_exit = false;

            // 1. Protective exits against this bar's range
            if (!portfolio.isFlat()) {
                const core::Position& position = portfolio.getPosition();
                auto reason = checkRiskExit(position, bar, config.risk_exit_priority);
                if (reason) {
                    double level = (*reason == core::ExitReason::StopLoss) ? *position.stop_loss : *position.take_profit;
                    portfolio.closePosition(bar.timestamp, i, level, *reason);
                    forced_exit = true;
                }
            }

            // 2./3. Strategy sees bars [0, i] only
            if (!forced_exit && i + 1 >= lookback) {
                core::Signal signal = strategy.generateSignal(series.windowUpTo(i), resolved);
                if (signal.action != core::SignalAction::Hold) {
                    logger->trace("Bar {} ({}): {}", i, core::utils::timestampToString(bar.timestamp),
                        core::toString(signal.action));
                }

                switch (signal.action) {
                    case core::SignalAction::EnterLong:
                    case core::SignalAction::EnterShort:
                        if (portfolio.isFlat() && i < last) {
                            openFromSignal(portfolio, signal, bar, i, config);
                        }
                        break;
                    case core::SignalAction::Exit:
                        if (!portfolio.isFlat()) {
                            portfolio.closePosition(bar.timestamp, i, bar.close, core::ExitReason::Signal);
                        }
                        break;
                    case core::SignalAction::Hold:
                        break;
                }
            }

            // 6. Nothing stays open past the data
            if (i == last && !portfolio.isFlat()) {
                portfolio.closePosition(bar.timestamp, i, bar.close, core::ExitReason::EndOfData);
            }

            // 5. Mark to market
            portfolio.recordTimestampValue(bar.timestamp, bar.close);
        }

        BacktestResult result;
        result.strategy_name = strategy.getName();
        result.symbol = series.getSymbol();
        result.interval = series.getInterval();
        result.parameters = std::move(resolved);
        result.start_time = series[0].timestamp;
        result.end_time = series[last].timestamp;
        result.initial_capital = config.initial_capital;
        result.final_equity = portfolio.getEquityCurve().back().equity;
        result.config = config;
        result.trades = portfolio.getTradeLog();
        result.equity_curve = portfolio.getEquityCurve();

        logger->debug("'{}' finished: {} trades, final equity {:.2f}.",
            result.strategy_name, result.trades.size(), result.final_equity);
        return result;
    }

} // namespace backtester

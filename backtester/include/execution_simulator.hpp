#pragma once

#include <optional>

#include "datatypes.hpp"
#include "price_series.hpp"
#include "interfaces.hpp"       // strategy_engine::IStrategy
#include "backtest_config.hpp"
#include "backtest_result.hpp"
#include "portfolio.hpp"

namespace backtester {

    // Bar-by-bar replay of one strategy over one series. Holds no state
    // between runs, so a single instance may be shared across threads.
    class ExecutionSimulator {
    public:
        ExecutionSimulator() = default;
        // Throws core::InvalidParameterError if the config is invalid
        explicit ExecutionSimulator(BacktestConfig config);

        const BacktestConfig& getConfig() const { return config_; }

        // Throws core::DataIntegrityError, core::InvalidParameterError or
        // core::InsufficientDataError when a precondition fails.
        BacktestResult run(const core::PriceSeries& series,
                           const strategy_engine::IStrategy& strategy,
                           const core::ParameterSet& params) const;

        // Same, with capital and cost rates overriding the held config
        BacktestResult run(const core::PriceSeries& series,
                           const strategy_engine::IStrategy& strategy,
                           const core::ParameterSet& params,
                           double initial_capital,
                           double commission_rate,
                           double slippage_rate) const;

    private:
        BacktestConfig config_;

        BacktestResult simulate(const core::PriceSeries& series,
                                const strategy_engine::IStrategy& strategy,
                                const core::ParameterSet& params,
                                const BacktestConfig& config) const;

        // Stop-loss / take-profit breach on `bar`, honoring the configured priority
        std::optional<core::ExitReason> checkRiskExit(const core::Position& position,
                                                      const core::Bar& bar,
                                                      RiskExitPriority priority) const;

        void openFromSignal(Portfolio& portfolio,
                            const core::Signal& signal,
                            const core::Bar& bar,
                            std::size_t bar_index,
                            const BacktestConfig& config) const;
    };

} // namespace backtester

#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "backtest_config.hpp"

namespace backtester {

    // Everything one simulation run produced. Never modified after run() returns.
    struct BacktestResult {
        std::string strategy_name;
        std::string symbol;
        std::string interval;
        core::ParameterSet parameters; // Resolved (defaults merged)
        core::Timestamp start_time;
        core::Timestamp end_time;
        double initial_capital = 0.0;
        double final_equity = 0.0;
        BacktestConfig config;
        std::vector<core::Trade> trades;              // Chronological
        std::vector<core::EquityPoint> equity_curve;  // One point per bar
    };

} // namespace backtester

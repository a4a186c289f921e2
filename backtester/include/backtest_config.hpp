#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    using json = nlohmann::json;

    // Which forced exit wins when one bar breaches both levels
    enum class RiskExitPriority {
        StopLossFirst,
        TakeProfitFirst
    };

    std::string toString(RiskExitPriority priority);
    // Throws core::InvalidParameterError for unknown names
    RiskExitPriority riskExitPriorityFromString(const std::string& value);

    struct BacktestConfig {
        double initial_capital = 10000.0;
        double commission_rate = 0.001;        // Fraction of notional per fill
        double slippage_rate = 0.0005;         // Fraction of price, always against the trader
        double max_position_fraction = 0.95;   // Share of equity committed per entry
        std::optional<double> stop_loss_fraction;   // Distance below (long) / above (short) entry
        std::optional<double> take_profit_fraction; // Distance above (long) / below (short) entry
        RiskExitPriority risk_exit_priority = RiskExitPriority::StopLossFirst;

        // Throws core::InvalidParameterError naming the first offending field
        void validate() const;

        // Missing keys keep their defaults. Throws core::ConfigException on
        // wrong JSON types and core::InvalidParameterError on bad values.
        static BacktestConfig fromJson(const json& j);
        json toJson() const;
    };

} // namespace backtester

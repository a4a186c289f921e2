#pragma once

#include <vector>
#include <optional>
#include <cstddef>

#include "datatypes.hpp" // Position, Trade, EquityPoint

namespace backtester {

    // --- Cost Model ---
    // Fills are slipped against the trader and commission is charged on notional.
    struct CostModel {
        double commission_rate = 0.0;
        double slippage_rate = 0.0;

        double buyFill(double market_price) const { return market_price * (1.0 + slippage_rate); }
        double sellFill(double market_price) const { return market_price * (1.0 - slippage_rate); }
        double commission(double size, double fill_price) const { return commission_rate * size * fill_price; }
    };

    // --- Portfolio Class Definition ---
    // Cash plus at most one open position for a single instrument, the trade
    // ledger and the equity curve of one simulation run.
    class Portfolio {
    public:
        // Throws std::invalid_argument if initial_capital is not positive
        Portfolio(double initial_capital, CostModel costs);

        // --- Getters ---
        double getInitialCapital() const { return initial_capital_; }
        double getCash() const { return cash_; }
        bool isFlat() const { return position_.side == core::PositionSide::Flat; }
        const core::Position& getPosition() const { return position_; }
        // Cash plus signed size marked at `mark_price`
        double getEquity(double mark_price) const;
        const std::vector<core::EquityPoint>& getEquityCurve() const { return equity_curve_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }
        int getTotalExecutions() const { return execution_count_; }

        // --- Modifiers ---
        // Opens a position worth `fraction` of current equity at the slipped fill.
        // Throws core::BacktestException unless flat or if equity is not positive.
        const core::Position& openPosition(core::PositionSide side,
                                           core::Timestamp timestamp,
                                           std::size_t bar_index,
                                           double market_price,
                                           double fraction,
                                           std::optional<double> stop_loss = std::nullopt,
                                           std::optional<double> take_profit = std::nullopt);

        // Closes the open position at the slipped fill and appends the Trade.
        // Throws core::BacktestException when flat.
        const core::Trade& closePosition(core::Timestamp timestamp,
                                         std::size_t bar_index,
                                         double market_price,
                                         core::ExitReason reason);

        // Appends one equity point marked at `mark_price`
        void recordTimestampValue(core::Timestamp timestamp, double mark_price);

    private:
        double initial_capital_;
        double cash_;
        CostModel costs_;
        core::Position position_;
        std::vector<core::EquityPoint> equity_curve_;
        std::vector<core::Trade> trade_log_;
        int execution_count_ = 0;
    };

} // namespace backtester

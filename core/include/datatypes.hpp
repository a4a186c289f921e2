#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <map>      // For parameter sets
#include <optional> // For optional stop/target levels
#include <cstddef>

namespace core {

    // Using system_clock for time points; all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV observation for a fixed interval
    struct Bar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Crypto volumes are fractional

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class SignalAction {
        Hold,
        EnterLong,
        EnterShort,
        Exit
    };

    enum class PositionSide {
        Flat,
        Long,
        Short
    };

    enum class ExitReason {
        Signal,
        StopLoss,
        TakeProfit,
        EndOfData
    };

    struct Signal {
        SignalAction action = SignalAction::Hold;
        std::optional<double> stop_loss_price;   // Absolute price level
        std::optional<double> take_profit_price; // Absolute price level

        static Signal hold() { return Signal{}; }
        static Signal enterLong() { return Signal{SignalAction::EnterLong, std::nullopt, std::nullopt}; }
        static Signal enterShort() { return Signal{SignalAction::EnterShort, std::nullopt, std::nullopt}; }
        static Signal exit() { return Signal{SignalAction::Exit, std::nullopt, std::nullopt}; }
    };

    // The single open position of a simulation. Owned by the backtester's Portfolio.
    struct Position {
        PositionSide side = PositionSide::Flat;
        Timestamp entry_time;
        std::size_t entry_index = 0;     // Bar index of the entry fill
        double entry_price = 0.0;        // Fill price (slippage applied)
        double entry_market_price = 0.0; // Reference price before slippage
        double size = 0.0;               // Always positive, side gives the sign
        double entry_commission = 0.0;
        std::optional<double> stop_loss;
        std::optional<double> take_profit;
    };

    // A closed round trip. Immutable once appended to the ledger.
    struct Trade {
        Timestamp entry_time;
        Timestamp exit_time;
        std::size_t entry_index = 0;
        std::size_t exit_index = 0;
        PositionSide side = PositionSide::Long;
        double entry_price = 0.0;        // Fill prices
        double exit_price = 0.0;
        double entry_market_price = 0.0; // Reference prices
        double exit_market_price = 0.0;
        double size = 0.0;
        double gross_pnl = 0.0;     // Price move at reference prices
        double commission = 0.0;    // Entry + exit
        double slippage_cost = 0.0; // Entry + exit
        double net_pnl = 0.0;       // gross_pnl - commission - slippage_cost
        double return_pct = 0.0;    // net_pnl / entry notional
        ExitReason exit_reason = ExitReason::Signal;
    };

    struct EquityPoint {
        Timestamp timestamp;
        double equity = 0.0; // Cash + mark-to-market value of the open position
    };

    // Strategy parameters by name. Integer parameters are stored as whole doubles.
    using ParameterSet = std::map<std::string, double>;

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string toString(SignalAction action);
    std::string toString(PositionSide side);
    std::string toString(ExitReason reason);

    // Inverse of toString(ExitReason). Throws std::invalid_argument.
    ExitReason exitReasonFromString(const std::string& value);

} // namespace core

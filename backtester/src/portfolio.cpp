#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <cmath>

namespace backtester {

    Portfolio::Portfolio(double initial_capital, CostModel costs)
        : initial_capital_(initial_capital), cash_(initial_capital), costs_(costs) {
        if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
    }

    double Portfolio::getEquity(double mark_price) const {
        switch (position_.side) {
            case core::PositionSide::Long:  return cash_ + position_.size * mark_price;
            case core::PositionSide::Short: return cash_ - position_.size * mark_price;
            default:                        return cash_;
        }
    }

    void Portfolio::recordTimestampValue(core::Timestamp timestamp, double mark_price) {
        equity_curve_.push_back(core::EquityPoint{timestamp, getEquity(mark_price)});
    }

    const core::Position& Portfolio::openPosition(core::PositionSide side,
                                                  core::Timestamp timestamp,
                                                  std::size_t bar_index,
                                                  double market_price,
                                                  double fraction,
                                                  std::optional<double> stop_loss,
                                                  std::optional<double> take_profit)
    {
        if (!isFlat()) {
            throw core::BacktestException(fmt::format(
                "Cannot open a {} position at bar {}: a {} position is already open.",
                core::toString(side), bar_index, core::toString(position_.side)));
        }
        if (side == core::PositionSide::Flat) {
            throw core::BacktestException("Cannot open a flat position.");
        }
        double equity = getEquity(market_price);
        if (!(equity > 0.0)) {
            throw core::BacktestException(fmt::format(
                "Cannot open a position at bar {} with non-positive equity {:.2f}.", bar_index, equity));
        }

        double fill = (side == core::PositionSide::Long) ? costs_.buyFill(market_price) : costs_.sellFill(market_price);
        double size = fraction * equity / fill;
        double commission = costs_.commission(size, fill);

        if (side == core::PositionSide::Long) {
            cash_ -= size * fill + commission;
        } else {
            cash_ += size * fill - commission;
        }

        position_.side = side;
        position_.entry_time = timestamp;
        position_.entry_index = bar_index;
        position_.entry_price = fill;
        position_.entry_market_price = market_price;
        position_.size = size;
        position_.entry_commission = commission;
        position_.stop_loss = stop_loss;
        position_.take_profit = take_profit;
        execution_count_++;

        core::logging::getLogger()->debug(
            "Opened {} at {} (bar {}): size={:.6f}, fill={:.4f}, market={:.4f}, commission={:.4f}, cash={:.2f}",
            core::toString(side), core::utils::timestampToString(timestamp), bar_index,
            size, fill, market_price, commission, cash_);
        return position_;
    }

    const core::Trade& Portfolio::closePosition(core::Timestamp timestamp,
                                                std::size_t bar_index,
                                                double market_price,
                                                core::ExitReason reason)
    {
        if (isFlat()) {
            throw core::BacktestException(fmt::format("Cannot close at bar {}: no open position.", bar_index));
        }

        bool is_long = position_.side == core::PositionSide::Long;
        double direction = is_long ? 1.0 : -1.0;
        double fill = is_long ? costs_.sellFill(market_price) : costs_.buyFill(market_price);
        double exit_commission = costs_.commission(position_.size, fill);

        if (is_long) {
            cash_ += position_.size * fill - exit_commission;
        } else {
            cash_ -= position_.size * fill + exit_commission;
        }

        core::Trade trade;
        trade.entry_time = position_.entry_time;
        trade.exit_time = timestamp;
        trade.entry_index = position_.entry_index;
        trade.exit_index = bar_index;
        trade.side = position_.side;
        trade.entry_price = position_.entry_price;
        trade.exit_price = fill;
        trade.entry_market_price = position_.entry_market_price;
        trade.exit_market_price = market_price;
        trade.size = position_.size;
        trade.gross_pnl = direction * (market_price - position_.entry_market_price) * position_.size;
        trade.commission = position_.entry_commission + exit_commission;
        trade.slippage_cost = position_.size * (std::abs(position_.entry_price - position_.entry_market_price) +
                                                std::abs(fill - market_price));
        trade.net_pnl = trade.gross_pnl - trade.commission - trade.slippage_cost;
        double entry_notional = position_.size * position_.entry_price;
        trade.return_pct = entry_notional > 0.0 ? trade.net_pnl / entry_notional : 0.0;
        trade.exit_reason = reason;

        trade_log_.push_back(trade);
        position_ = core::Position{};
        execution_count_++;

        core::logging::getLogger()->debug(
            "Closed {} at {} (bar {}, {}): fill={:.4f}, gross={:.2f}, net={:.2f}, cash={:.2f}",
            core::toString(trade.side), core::utils::timestampToString(timestamp), bar_index,
            core::toString(reason), fill, trade.gross_pnl, trade.net_pnl, cash_);
        return trade_log_.back();
    }

} // namespace backtester

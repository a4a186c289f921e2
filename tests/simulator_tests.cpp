#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

#include "exceptions.hpp"
#include "backtest_config.hpp"
#include "execution_simulator.hpp"
#include "portfolio.hpp"
#include "scripted_strategy.hpp"
#include "test_support.hpp"

using backtester::BacktestConfig;
using backtester::ExecutionSimulator;
using backtester::RiskExitPriority;
using test_support::ScriptedStrategy;
using test_support::makeBar;

namespace {

    BacktestConfig frictionless() {
        BacktestConfig config;
        config.commission_rate = 0.0;
        config.slippage_rate = 0.0;
        config.max_position_fraction = 1.0;
        return config;
    }

    // Entry bar at 100, then a bar that spans [low, high] and closes at 100
    core::PriceSeries rangeSeries(double low, double high) {
        return test_support::seriesFromBars({
            makeBar(0, 100, 100, 100, 100),
            makeBar(1, 100, 100, 100, 100),
            makeBar(2, 98, high, low, 100),
            makeBar(3, 100, 100, 100, 100)});
    }

} // namespace

// --- config ---

TEST(BacktestConfigTest, DefaultsAreValid) {
    BacktestConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.initial_capital, 10000.0);
    EXPECT_EQ(config.risk_exit_priority, RiskExitPriority::StopLossFirst);
}

TEST(BacktestConfigTest, RejectsOutOfRangeValues) {
    BacktestConfig config;
    config.initial_capital = 0.0;
    EXPECT_THROW(config.validate(), core::InvalidParameterError);

    config = BacktestConfig{};
    config.commission_rate = -0.01;
    EXPECT_THROW(config.validate(), core::InvalidParameterError);

    config = BacktestConfig{};
    config.max_position_fraction = 1.5;
    EXPECT_THROW(config.validate(), core::InvalidParameterError);

    config = BacktestConfig{};
    config.stop_loss_fraction = 1.0;
    EXPECT_THROW(config.validate(), core::InvalidParameterError);

    config = BacktestConfig{};
    config.initial_capital = -5.0;
    EXPECT_THROW(ExecutionSimulator{config}, core::InvalidParameterError);
}

TEST(BacktestConfigTest, ReadsJsonAndKeepsDefaults) {
    auto config = BacktestConfig::fromJson(nlohmann::json{
        {"initial_capital", 5000}, {"stop_loss_fraction", 0.05}, {"risk_exit_priority", "take_profit_first"}});
    EXPECT_DOUBLE_EQ(config.initial_capital, 5000.0);
    EXPECT_DOUBLE_EQ(config.commission_rate, 0.001);
    ASSERT_TRUE(config.stop_loss_fraction.has_value());
    EXPECT_DOUBLE_EQ(*config.stop_loss_fraction, 0.05);
    EXPECT_FALSE(config.take_profit_fraction.has_value());
    EXPECT_EQ(config.risk_exit_priority, RiskExitPriority::TakeProfitFirst);

    auto round_trip = BacktestConfig::fromJson(config.toJson());
    EXPECT_DOUBLE_EQ(round_trip.initial_capital, 5000.0);
    EXPECT_EQ(round_trip.risk_exit_priority, RiskExitPriority::TakeProfitFirst);

    EXPECT_THROW(BacktestConfig::fromJson(nlohmann::json{{"initial_capital", "lots"}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson(nlohmann::json{{"risk_exit_priority", "coin_flip"}}), core::InvalidParameterError);
}

// --- portfolio ---

TEST(PortfolioTest, AppliesSlippageAndCommissionOnBothLegs) {
    backtester::Portfolio portfolio(10000.0, backtester::CostModel{0.001, 0.0005});
    const auto& position = portfolio.openPosition(core::PositionSide::Long, test_support::day(0), 0, 100.0, 0.5);
    EXPECT_DOUBLE_EQ(position.entry_price, 100.05);
    EXPECT_NEAR(position.size, 5000.0 / 100.05, 1e-12);
    EXPECT_NEAR(portfolio.getCash(), 10000.0 - 5000.0 - 5.0, 1e-9);

    const auto& trade = portfolio.closePosition(test_support::day(1), 1, 110.0, core::ExitReason::Signal);
    EXPECT_DOUBLE_EQ(trade.exit_price, 110.0 * 0.9995);
    EXPECT_NEAR(trade.net_pnl, trade.gross_pnl - trade.commission - trade.slippage_cost, 1e-9);
    EXPECT_NEAR(portfolio.getCash(), 10000.0 + trade.net_pnl, 1e-9);
    EXPECT_TRUE(portfolio.isFlat());
    EXPECT_EQ(portfolio.getTotalExecutions(), 2);
}

TEST(PortfolioTest, RejectsInvalidTransitions) {
    backtester::Portfolio portfolio(1000.0, backtester::CostModel{});
    EXPECT_THROW(portfolio.closePosition(test_support::day(0), 0, 10.0, core::ExitReason::Signal), core::BacktestException);
    portfolio.openPosition(core::PositionSide::Short, test_support::day(0), 0, 10.0, 1.0);
    EXPECT_THROW(portfolio.openPosition(core::PositionSide::Long, test_support::day(1), 1, 10.0, 1.0),
                 core::BacktestException);
    EXPECT_THROW(backtester::Portfolio(0.0, backtester::CostModel{}), std::invalid_argument);
}

TEST(PortfolioTest, ShortEquityMovesAgainstPrice) {
    backtester::Portfolio portfolio(1000.0, backtester::CostModel{});
    portfolio.openPosition(core::PositionSide::Short, test_support::day(0), 0, 10.0, 1.0);
    EXPECT_DOUBLE_EQ(portfolio.getEquity(10.0), 1000.0);
    EXPECT_DOUBLE_EQ(portfolio.getEquity(8.0), 1200.0);
    EXPECT_DOUBLE_EQ(portfolio.getEquity(12.0), 800.0);
}

// --- simulator ---

class ExecutionSimulatorTest : public ::testing::Test {
protected:
    core::PriceSeries series_ = test_support::seriesFromCloses({100, 100, 110, 120, 120});
};

TEST_F(ExecutionSimulatorTest, SignalRoundTripAccounting) {
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}, {3, core::Signal::exit()}});
    ExecutionSimulator simulator;
    auto result = simulator.run(series_, strategy, {});

    ASSERT_EQ(result.trades.size(), 1u);
    const auto& trade = result.trades.front();
    EXPECT_EQ(trade.entry_index, 1u);
    EXPECT_EQ(trade.exit_index, 3u);
    EXPECT_EQ(trade.exit_reason, core::ExitReason::Signal);
    EXPECT_EQ(trade.side, core::PositionSide::Long);
    EXPECT_DOUBLE_EQ(trade.entry_price, 100.0 * 1.0005);
    EXPECT_DOUBLE_EQ(trade.exit_price, 120.0 * 0.9995);
    EXPECT_NEAR(trade.gross_pnl, 20.0 * trade.size, 1e-9);
    EXPECT_EQ(trade.net_pnl, trade.gross_pnl - trade.commission - trade.slippage_cost);
    EXPECT_GT(trade.exit_time, trade.entry_time);

    ASSERT_EQ(result.equity_curve.size(), series_.size());
    EXPECT_NEAR(result.final_equity, 10000.0 + trade.net_pnl, 1e-6);
    EXPECT_DOUBLE_EQ(result.equity_curve.front().equity, 10000.0);
    EXPECT_EQ(result.equity_curve[2].timestamp, series_[2].timestamp);
    EXPECT_EQ(result.strategy_name, "scripted");
    EXPECT_EQ(result.start_time, series_[0].timestamp);
    EXPECT_EQ(result.end_time, series_[4].timestamp);
}

TEST_F(ExecutionSimulatorTest, FrictionlessLongCapturesFullMove) {
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}, {3, core::Signal::exit()}});
    ExecutionSimulator simulator(frictionless());
    auto result = simulator.run(series_, strategy, {});
    EXPECT_NEAR(result.final_equity, 12000.0, 1e-9);
    EXPECT_NEAR(result.equity_curve[2].equity, 11000.0, 1e-9);
}

TEST_F(ExecutionSimulatorTest, OverloadOverridesCapitalAndCosts) {
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}, {3, core::Signal::exit()}});
    ExecutionSimulator simulator;
    auto result = simulator.run(series_, strategy, {}, 1000.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(result.initial_capital, 1000.0);
    EXPECT_NEAR(result.final_equity, 1000.0 + 0.95 * 1000.0 * 0.2, 1e-9);
}

TEST(ExecutionSimulatorShortTest, ShortProfitsFromDecline) {
    auto series = test_support::seriesFromCloses({100, 100, 90, 90});
    ScriptedStrategy strategy({{1, core::Signal::enterShort()}, {2, core::Signal::exit()}});
    ExecutionSimulator simulator(frictionless());
    auto result = simulator.run(series, strategy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].side, core::PositionSide::Short);
    EXPECT_NEAR(result.trades[0].gross_pnl, 1000.0, 1e-9);
    EXPECT_NEAR(result.final_equity, 11000.0, 1e-9);
}

TEST_F(ExecutionSimulatorTest, OpenPositionIsClosedAtEndOfData) {
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}});
    auto result = ExecutionSimulator().run(series_, strategy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::EndOfData);
    EXPECT_EQ(result.trades[0].exit_index, series_.size() - 1);
    EXPECT_NEAR(result.final_equity, 10000.0 + result.trades[0].net_pnl, 1e-6);
}

TEST_F(ExecutionSimulatorTest, IgnoresEntryOnLastBarAndRedundantSignals) {
    ScriptedStrategy last_bar({{4, core::Signal::enterLong()}});
    EXPECT_TRUE(ExecutionSimulator().run(series_, last_bar, {}).trades.empty());

    ScriptedStrategy noisy({{0, core::Signal::exit()},
                            {1, core::Signal::enterLong()},
                            {2, core::Signal::enterShort()},
                            {3, core::Signal::exit()},
                            {4, core::Signal::exit()}});
    auto result = ExecutionSimulator().run(series_, noisy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].side, core::PositionSide::Long);
    EXPECT_EQ(result.trades[0].exit_index, 3u);
}

TEST_F(ExecutionSimulatorTest, StrategyOnlySeesBarsUpToCurrentStep) {
    ScriptedStrategy strategy({}, 3);
    ExecutionSimulator().run(series_, strategy, {});
    EXPECT_EQ(strategy.seenSizes(), (std::vector<std::size_t>{3, 4, 5}));
}

TEST_F(ExecutionSimulatorTest, RunsAreIdempotent) {
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}, {3, core::Signal::exit()}});
    ExecutionSimulator simulator;
    auto first = simulator.run(series_, strategy, {});
    auto second = simulator.run(series_, strategy, {});
    ASSERT_EQ(first.trades.size(), second.trades.size());
    EXPECT_EQ(first.trades[0].net_pnl, second.trades[0].net_pnl);
    ASSERT_EQ(first.equity_curve.size(), second.equity_curve.size());
    for (std::size_t i = 0; i < first.equity_curve.size(); ++i) {
        EXPECT_EQ(first.equity_curve[i].equity, second.equity_curve[i].equity);
    }
    EXPECT_EQ(first.final_equity, second.final_equity);
}

// --- preconditions ---

TEST_F(ExecutionSimulatorTest, InsufficientDataReportsCounts) {
    ScriptedStrategy strategy({}, 10);
    try {
        ExecutionSimulator().run(series_, strategy, {});
        FAIL() << "Expected InsufficientDataError";
    } catch (const core::InsufficientDataError& e) {
        EXPECT_EQ(e.requiredBars(), 10u);
        EXPECT_EQ(e.availableBars(), 5u);
    }
    EXPECT_THROW(ExecutionSimulator().run(core::PriceSeries(), ScriptedStrategy({}), {}), core::InsufficientDataError);
}

TEST_F(ExecutionSimulatorTest, RejectsBadParametersAndBadData) {
    ScriptedStrategy strategy({});
    EXPECT_THROW(ExecutionSimulator().run(series_, strategy, {{"period", 3.0}}), core::InvalidParameterError);

    auto broken = test_support::seriesFromBars({makeBar(0, 100, 100, 100, 100), makeBar(0, 100, 100, 100, 100)});
    EXPECT_THROW(ExecutionSimulator().run(broken, strategy, {}), core::DataIntegrityError);
}

// --- protective exits ---

TEST(RiskExitTest, StopLossFillsAtLevelRegardlessOfClose) {
    auto series = rangeSeries(94.0, 101.0);
    ScriptedStrategy strategy({{1, test_support::longWithLevels(95.0, std::nullopt)},
                               {2, core::Signal::enterLong()}});
    auto result = ExecutionSimulator().run(series, strategy, {});

    ASSERT_EQ(result.trades.size(), 1u);
    const auto& trade = result.trades[0];
    EXPECT_EQ(trade.exit_reason, core::ExitReason::StopLoss);
    EXPECT_EQ(trade.exit_index, 2u);
    EXPECT_DOUBLE_EQ(trade.exit_market_price, 95.0);
    EXPECT_DOUBLE_EQ(trade.exit_price, 95.0 * 0.9995);
    EXPECT_LT(trade.net_pnl, 0.0);
}

TEST(RiskExitTest, TakeProfitFillsAtLevel) {
    auto series = rangeSeries(99.0, 106.0);
    ScriptedStrategy strategy({{1, test_support::longWithLevels(95.0, 105.0)}});
    auto result = ExecutionSimulator().run(series, strategy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::TakeProfit);
    EXPECT_DOUBLE_EQ(result.trades[0].exit_market_price, 105.0);
}

TEST(RiskExitTest, SameBarTiePrefersConfiguredExit) {
    auto series = rangeSeries(94.0, 106.0);
    ScriptedStrategy strategy({{1, test_support::longWithLevels(95.0, 105.0)}});

    auto stop_first = ExecutionSimulator().run(series, strategy, {});
    ASSERT_EQ(stop_first.trades.size(), 1u);
    EXPECT_EQ(stop_first.trades[0].exit_reason, core::ExitReason::StopLoss);

    BacktestConfig config;
    config.risk_exit_priority = RiskExitPriority::TakeProfitFirst;
    auto target_first = ExecutionSimulator(config).run(series, strategy, {});
    ASSERT_EQ(target_first.trades.size(), 1u);
    EXPECT_EQ(target_first.trades[0].exit_reason, core::ExitReason::TakeProfit);
}

TEST(RiskExitTest, ConfigFractionsSetLevels) {
    auto series = rangeSeries(95.0, 101.0);
    BacktestConfig config;
    config.stop_loss_fraction = 0.05;
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}});
    auto result = ExecutionSimulator(config).run(series, strategy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::StopLoss);
    EXPECT_DOUBLE_EQ(result.trades[0].exit_market_price, 95.0);
}

TEST(RiskExitTest, WrongSideLevelIsDiscarded) {
    auto series = rangeSeries(90.0, 101.0);
    ScriptedStrategy strategy({{1, test_support::longWithLevels(105.0, std::nullopt)}});
    auto result = ExecutionSimulator().run(series, strategy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::EndOfData);
}

TEST(RiskExitTest, ShortStopTriggersOnHigh) {
    auto series = rangeSeries(99.0, 104.0);
    core::Signal short_entry = core::Signal::enterShort();
    short_entry.stop_loss_price = 103.0;
    ScriptedStrategy strategy({{1, short_entry}});
    auto result = ExecutionSimulator().run(series, strategy, {});
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::StopLoss);
    EXPECT_DOUBLE_EQ(result.trades[0].exit_price, 103.0 * 1.0005);
}

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "execution_simulator.hpp"
#include "metrics_engine.hpp"
#include "result_export.hpp"
#include "strategy_registry.hpp"
#include "scripted_strategy.hpp"
#include "test_support.hpp"

using backtester::BacktestConfig;
using backtester::ExecutionSimulator;
using metrics::MetricsEngine;
using test_support::ScriptedStrategy;
using test_support::makeBar;
using json = nlohmann::json;

namespace {

    std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

} // namespace

TEST(ScenarioTest, FlatMarketProducesNoTrades) {
    auto series = test_support::seriesFromCloses(std::vector<double>(100, 100.0));
    auto registry = strategy_engine::StrategyRegistry::withBuiltins();
    ExecutionSimulator simulator;
    MetricsEngine engine;

    for (const auto& name : registry.names()) {
        auto strategy = registry.get(name);
        auto result = simulator.run(series, *strategy, {});
        auto metrics = engine.compute(result);

        EXPECT_TRUE(result.trades.empty()) << name;
        EXPECT_DOUBLE_EQ(result.final_equity, result.initial_capital) << name;
        ASSERT_TRUE(metrics.total_return.has_value()) << name;
        EXPECT_DOUBLE_EQ(*metrics.total_return, 0.0) << name;
        EXPECT_DOUBLE_EQ(metrics.max_drawdown, 0.0) << name;
        EXPECT_EQ(metrics.total_trades, 0u) << name;
    }
}

TEST(ScenarioTest, BuyAndHoldOnRisingMarketClosesAtEndOfData) {
    auto series = test_support::seriesFromCloses(test_support::linearCloses(50, 100.0, 1.0));
    ScriptedStrategy strategy({{0, core::Signal::enterLong()}});
    auto result = ExecutionSimulator().run(series, strategy, {});

    ASSERT_EQ(result.trades.size(), 1u);
    const auto& trade = result.trades[0];
    EXPECT_EQ(trade.entry_index, 0u);
    EXPECT_EQ(trade.exit_index, 49u);
    EXPECT_EQ(trade.exit_reason, core::ExitReason::EndOfData);
    EXPECT_GT(trade.net_pnl, 0.0);
    EXPECT_GT(result.final_equity, result.initial_capital);

    auto metrics = MetricsEngine().compute(result);
    EXPECT_EQ(metrics.winning_trades, 1u);
    ASSERT_TRUE(metrics.profit_factor.has_value());
    EXPECT_TRUE(std::isinf(*metrics.profit_factor));
    EXPECT_EQ(metrics.exit_reason_counts.at("end_of_data"), 1u);
}

TEST(ScenarioTest, ConfiguredStopLossCutsLosingTrade) {
    auto series = test_support::seriesFromBars({
        makeBar(0, 100, 100, 100, 100),
        makeBar(1, 100, 101, 99, 100),
        makeBar(2, 99, 99, 90, 91),
        makeBar(3, 91, 92, 88, 89),
        makeBar(4, 89, 89, 85, 86)});
    ScriptedStrategy strategy({{1, core::Signal::enterLong()}});
    BacktestConfig config;
    config.stop_loss_fraction = 0.05;
    auto result = ExecutionSimulator(config).run(series, strategy, {});

    ASSERT_EQ(result.trades.size(), 1u);
    const auto& trade = result.trades[0];
    EXPECT_EQ(trade.exit_reason, core::ExitReason::StopLoss);
    EXPECT_EQ(trade.exit_index, 2u);
    EXPECT_DOUBLE_EQ(trade.exit_market_price, 95.0);
    EXPECT_LT(trade.net_pnl, 0.0);

    // Flat after the stop, so equity no longer follows the decline
    EXPECT_DOUBLE_EQ(result.equity_curve[3].equity, result.equity_curve[4].equity);
    EXPECT_DOUBLE_EQ(result.final_equity, result.equity_curve.back().equity);
}

TEST(ScenarioTest, NoTradesLeavesTradeRatiosUndefined) {
    auto series = test_support::seriesFromCloses(test_support::linearCloses(30, 100.0, 0.5));
    ScriptedStrategy strategy({});
    auto result = ExecutionSimulator().run(series, strategy, {});
    auto metrics = MetricsEngine().compute(result);

    EXPECT_EQ(metrics.total_trades, 0u);
    EXPECT_FALSE(metrics.profit_factor.has_value());
    EXPECT_FALSE(metrics.win_rate.has_value());
    EXPECT_FALSE(metrics.expectancy.has_value());

    json summary = reporting::summaryToJson(result, metrics);
    EXPECT_TRUE(summary["metrics"]["profit_factor"].is_null());
    EXPECT_TRUE(summary["metrics"]["win_rate"].is_null());
    EXPECT_EQ(summary["metrics"]["total_trades"], 0);
}

class CrossoverScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        series_ = test_support::seriesFromCloses(test_support::zigZagCloses(300, 100.0, 20.0, 40));
        auto registry = strategy_engine::StrategyRegistry::withBuiltins();
        selection_ = registry.select(json{{"name", "sma_crossover"}, {"parameters", {{"fast_period", 5}, {"slow_period", 20}}}});
        result_ = ExecutionSimulator().run(series_, *selection_.strategy, selection_.parameters);
        metrics_ = MetricsEngine().compute(result_);
    }

    core::PriceSeries series_;
    strategy_engine::StrategySelection selection_;
    backtester::BacktestResult result_;
    metrics::PerformanceMetrics metrics_;
};

TEST_F(CrossoverScenarioTest, LedgerInvariantsHold) {
    ASSERT_FALSE(result_.trades.empty());
    EXPECT_EQ(result_.equity_curve.size(), series_.size());
    EXPECT_EQ(result_.strategy_name, "sma_crossover");
    EXPECT_DOUBLE_EQ(result_.parameters.at("fast_period"), 5.0);

    double net_total = 0.0;
    for (std::size_t k = 0; k < result_.trades.size(); ++k) {
        const auto& trade = result_.trades[k];
        EXPECT_EQ(trade.net_pnl, trade.gross_pnl - trade.commission - trade.slippage_cost);
        EXPECT_GT(trade.exit_index, trade.entry_index);
        EXPECT_GT(trade.exit_time, trade.entry_time);
        EXPECT_GE(trade.entry_index, 20u);
        if (k > 0) {
            EXPECT_GT(trade.entry_index, result_.trades[k - 1].exit_index);
        }
        net_total += trade.net_pnl;
    }
    EXPECT_NEAR(result_.final_equity, result_.initial_capital + net_total, 1e-6);
}

TEST_F(CrossoverScenarioTest, MetricsStayInRange) {
    EXPECT_LE(metrics_.max_drawdown, 0.0);
    EXPECT_GE(metrics_.max_drawdown, -1.0);
    EXPECT_EQ(metrics_.total_trades, result_.trades.size());
    EXPECT_EQ(metrics_.winning_trades + metrics_.losing_trades, metrics_.total_trades);
    ASSERT_TRUE(metrics_.win_rate.has_value());
    EXPECT_GE(*metrics_.win_rate, 0.0);
    EXPECT_LE(*metrics_.win_rate, 1.0);
    EXPECT_NEAR(metrics_.net_profit, result_.final_equity - result_.initial_capital, 1e-9);
}

TEST_F(CrossoverScenarioTest, ExportWritesAllArtifacts) {
    test_support::TempPath dir("scenario_export");
    reporting::exportAll(dir.str(), "run", result_, metrics_);

    std::filesystem::path base(dir.str());
    for (const char* name : {"run_summary.json", "run_trades.csv", "run_trades.json", "run_equity.csv"}) {
        EXPECT_TRUE(std::filesystem::exists(base / name)) << name;
    }

    json summary = json::parse(readFile(base / "run_summary.json"));
    EXPECT_EQ(summary["strategy"], "sma_crossover");
    EXPECT_EQ(summary["bars"], series_.size());
    EXPECT_EQ(summary["parameters"]["slow_period"], 20.0);
    EXPECT_EQ(summary["metrics"]["total_trades"], result_.trades.size());

    json trades = json::parse(readFile(base / "run_trades.json"));
    ASSERT_EQ(trades.size(), result_.trades.size());
    EXPECT_EQ(trades[0]["side"], "long");

    std::string trades_csv = readFile(base / "run_trades.csv");
    EXPECT_EQ(trades_csv.rfind("entry_time,exit_time,entry_index", 0), 0u);
    auto csv_lines = static_cast<std::size_t>(std::count(trades_csv.begin(), trades_csv.end(), '\n'));
    EXPECT_EQ(csv_lines, result_.trades.size() + 1);

    std::string equity_csv = readFile(base / "run_equity.csv");
    auto equity_lines = static_cast<std::size_t>(std::count(equity_csv.begin(), equity_csv.end(), '\n'));
    EXPECT_EQ(equity_lines, series_.size() + 1);
}

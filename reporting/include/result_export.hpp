#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "backtest_result.hpp"
#include "performance_metrics.hpp"

namespace reporting {

    using json = nlohmann::json;

    // Run identity, config, parameters and metrics in one document
    json summaryToJson(const backtester::BacktestResult& result, const metrics::PerformanceMetrics& metrics);

    json tradeToJson(const core::Trade& trade);
    json tradesToJson(const std::vector<core::Trade>& trades);

    // Header row plus one row per trade / equity point
    std::string tradesToCsv(const std::vector<core::Trade>& trades);
    std::string equityCurveToCsv(const std::vector<core::EquityPoint>& equity_curve);

    // File writers. Parent directories are created. Throw core::BacktesterException on I/O failure.
    void writeSummaryJson(const std::string& path,
                          const backtester::BacktestResult& result,
                          const metrics::PerformanceMetrics& metrics);
    void writeTradesCsv(const std::string& path, const std::vector<core::Trade>& trades);
    void writeTradesJson(const std::string& path, const std::vector<core::Trade>& trades);
    void writeEquityCsv(const std::string& path, const std::vector<core::EquityPoint>& equity_curve);

    // All four artifacts as <dir>/<stem>_summary.json, _trades.csv, _trades.json, _equity.csv
    void exportAll(const std::string& directory,
                   const std::string& stem,
                   const backtester::BacktestResult& result,
                   const metrics::PerformanceMetrics& metrics);

    // Writes `content` to `path`, creating parent directories
    void writeTextFile(const std::string& path, const std::string& content);

} // namespace reporting

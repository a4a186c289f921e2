#include "result_export.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace reporting {

    namespace fs = std::filesystem;

    json summaryToJson(const backtester::BacktestResult& result, const metrics::PerformanceMetrics& metrics) {
        json j;
        j["strategy"] = result.strategy_name;
        j["symbol"] = result.symbol;
        j["interval"] = result.interval;
        j["parameters"] = result.parameters;
        j["start"] = core::utils::timestampToString(result.start_time);
        j["end"] = core::utils::timestampToString(result.end_time);
        j["bars"] = result.equity_curve.size();
        j["initial_capital"] = result.initial_capital;
        j["final_equity"] = result.final_equity;
        j["config"] = result.config.toJson();
        j["metrics"] = metrics.toJson();
        return j;
    }

    json tradeToJson(const core::Trade& trade) {
        return json{
            {"entry_time", core::utils::timestampToString(trade.entry_time)},
            {"exit_time", core::utils::timestampToString(trade.exit_time)},
            {"entry_index", trade.entry_index},
            {"exit_index", trade.exit_index},
            {"side", core::toString(trade.side)},
            {"entry_price", trade.entry_price},
            {"exit_price", trade.exit_price},
            {"entry_market_price", trade.entry_market_price},
            {"exit_market_price", trade.exit_market_price},
            {"size", trade.size},
            {"gross_pnl", trade.gross_pnl},
            {"commission", trade.commission},
            {"slippage_cost", trade.slippage_cost},
            {"net_pnl", trade.net_pnl},
            {"return_pct", trade.return_pct},
            {"exit_reason", core::toString(trade.exit_reason)}
        };
    }

    json tradesToJson(const std::vector<core::Trade>& trades) {
        json array = json::array();
        for (const auto& trade : trades) {
            array.push_back(tradeToJson(trade));
        }
        return array;
    }

    std::string tradesToCsv(const std::vector<core::Trade>& trades) {
        std::ostringstream out;
        out << "entry_time,exit_time,entry_index,exit_index,side,entry_price,exit_price,"
               "entry_market_price,exit_market_price,size,gross_pnl,commission,slippage_cost,"
               "net_pnl,return_pct,exit_reason\n";
        for (const auto& t : trades) {
            out << fmt::format("{},{},{},{},{},{:.8f},{:.8f},{:.8f},{:.8f},{:.8f},{:.8f},{:.8f},{:.8f},{:.8f},{:.8f},{}\n",
                core::utils::timestampToString(t.entry_time),
                core::utils::timestampToString(t.exit_time),
                t.entry_index, t.exit_index, core::toString(t.side),
                t.entry_price, t.exit_price, t.entry_market_price, t.exit_market_price,
                t.size, t.gross_pnl, t.commission, t.slippage_cost, t.net_pnl, t.return_pct,
                core::toString(t.exit_reason));
        }
        return out.str();
    }

    std::string equityCurveToCsv(const std::vector<core::EquityPoint>& equity_curve) {
        std::ostringstream out;
        out << "timestamp,equity\n";
        for (const auto& point : equity_curve) {
            out << fmt::format("{},{:.8f}\n", core::utils::timestampToString(point.timestamp), point.equity);
        }
        return out.str();
    }

    void writeTextFile(const std::string& path, const std::string& content) {
        fs::path target(path);
        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw core::BacktesterException(fmt::format(
                    "Cannot create directory '{}': {}", target.parent_path().string(), ec.message()));
            }
        }
        std::ofstream file(target, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw core::BacktesterException(fmt::format("Cannot open '{}' for writing.", path));
        }
        file << content;
        if (!file) {
            throw core::BacktesterException(fmt::format("Failed writing '{}'.", path));
        }
        core::logging::getLogger()->debug("Wrote {} bytes to {}", content.size(), path);
    }

    void writeSummaryJson(const std::string& path,
                          const backtester::BacktestResult& result,
                          const metrics::PerformanceMetrics& metrics)
    {
        writeTextFile(path, summaryToJson(result, metrics).dump(2) + "\n");
    }

    void writeTradesCsv(const std::string& path, const std::vector<core::Trade>& trades) {
        writeTextFile(path, tradesToCsv(trades));
    }

    void writeTradesJson(const std::string& path, const std::vector<core::Trade>& trades) {
        writeTextFile(path, tradesToJson(trades).dump(2) + "\n");
    }

    void writeEquityCsv(const std::string& path, const std::vector<core::EquityPoint>& equity_curve) {
        writeTextFile(path, equityCurveToCsv(equity_curve));
    }

    void exportAll(const std::string& directory,
                   const std::string& stem,
                   const backtester::BacktestResult& result,
                   const metrics::PerformanceMetrics& metrics)
    {
        fs::path base(directory);
        writeSummaryJson((base / (stem + "_summary.json")).string(), result, metrics);
        writeTradesCsv((base / (stem + "_trades.csv")).string(), result.trades);
        writeTradesJson((base / (stem + "_trades.json")).string(), result.trades);
        writeEquityCsv((base / (stem + "_equity.csv")).string(), result.equity_curve);
        core::logging::getLogger()->info("Exported results for '{}' to {}", result.strategy_name, base.string());
    }

} // namespace reporting

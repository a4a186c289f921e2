#include "optimization_export.hpp"
#include "result_export.hpp" // writeTextFile
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <sstream>

namespace optimizer {

    namespace {

        std::string csvCell(const metrics::MetricValue& value) {
            if (!value || std::isnan(*value)) {
                return "";
            }
            if (std::isinf(*value)) {
                return *value > 0 ? "inf" : "-inf";
            }
            return fmt::format("{:.8g}", *value);
        }

        void writeRow(std::ostringstream& out, const OptimizationReport& report,
                      const SweepOutcome& outcome, const std::string& rank)
        {
            out << rank;
            for (const auto& name : report.parameter_names) {
                auto it = outcome.parameters.find(name);
                out << ',' << (it != outcome.parameters.end() ? fmt::format("{:g}", it->second) : std::string());
            }
            out << ',' << toString(outcome.status) << ',' << csvCell(outcome.objective_value);
            if (outcome.metrics) {
                const auto& m = *outcome.metrics;
                out << ',' << csvCell(m.total_return) << ',' << csvCell(m.sharpe_ratio)
                    << ',' << csvCell(m.sortino_ratio) << ',' << csvCell(m.calmar_ratio)
                    << ',' << csvCell(m.max_drawdown) << ',' << csvCell(m.win_rate)
                    << ',' << csvCell(m.profit_factor) << ',' << m.total_trades;
            } else {
                out << ",,,,,,,,";
            }
            out << '\n';
        }

        json outcomeToJson(const SweepOutcome& outcome) {
            json j;
            j["combination_index"] = outcome.combination_index;
            j["parameters"] = outcome.parameters;
            j["status"] = toString(outcome.status);
            j["objective_value"] = metrics::metricToJson(outcome.objective_value);
            if (!outcome.message.empty()) {
                j["message"] = outcome.message;
            }
            if (outcome.metrics) {
                j["metrics"] = outcome.metrics->toJson();
            }
            return j;
        }

    } // namespace

    std::string reportToCsv(const OptimizationReport& report) {
        std::ostringstream out;
        out << "rank";
        for (const auto& name : report.parameter_names) {
            out << ',' << name;
        }
        out << ",status,objective,total_return,sharpe_ratio,sortino_ratio,calmar_ratio,"
               "max_drawdown,win_rate,profit_factor,total_trades\n";

        for (std::size_t i = 0; i < report.ranked.size(); ++i) {
            writeRow(out, report, report.ranked[i], std::to_string(i + 1));
        }
        for (const auto& outcome : report.skipped) {
            writeRow(out, report, outcome, "");
        }
        return out.str();
    }

    json reportToJson(const OptimizationReport& report) {
        json j;
        j["strategy"] = report.strategy_name;
        j["objective"] = toString(report.objective);
        j["parameter_names"] = report.parameter_names;
        j["grid_size"] = report.grid_size;
        j["evaluated"] = report.evaluated;
        j["capped"] = report.capped;
        j["halted"] = report.halted;
        j["ranked"] = json::array();
        for (const auto& outcome : report.ranked) {
            j["ranked"].push_back(outcomeToJson(outcome));
        }
        j["skipped"] = json::array();
        for (const auto& outcome : report.skipped) {
            j["skipped"].push_back(outcomeToJson(outcome));
        }
        return j;
    }

    void writeReportCsv(const std::string& path, const OptimizationReport& report) {
        reporting::writeTextFile(path, reportToCsv(report));
    }

    void writeReportJson(const std::string& path, const OptimizationReport& report) {
        reporting::writeTextFile(path, reportToJson(report).dump(2) + "\n");
    }

} // namespace optimizer

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "optimizer.hpp"

namespace optimizer {

    // One row per outcome: ranked runs first, then skip records.
    // Undefined metrics are empty cells, infinite ones "inf".
    std::string reportToCsv(const OptimizationReport& report);

    json reportToJson(const OptimizationReport& report);

    // Throw core::BacktesterException on I/O failure
    void writeReportCsv(const std::string& path, const OptimizationReport& report);
    void writeReportJson(const std::string& path, const OptimizationReport& report);

} // namespace optimizer

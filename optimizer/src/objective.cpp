#include "objective.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>
#include <vector>

namespace optimizer {

    namespace {

        const std::vector<std::pair<Objective, std::string>>& objectiveNames() {
            static const std::vector<std::pair<Objective, std::string>> names = {
                {Objective::TotalReturn, "total_return"},
                {Objective::Cagr, "cagr"},
                {Objective::SharpeRatio, "sharpe_ratio"},
                {Objective::SortinoRatio, "sortino_ratio"},
                {Objective::CalmarRatio, "calmar_ratio"},
                {Objective::MaxDrawdown, "max_drawdown"},
                {Objective::WinRate, "win_rate"},
                {Objective::ProfitFactor, "profit_factor"},
                {Objective::Expectancy, "expectancy"}
            };
            return names;
        }

    } // namespace

    std::string toString(Objective objective) {
        for (const auto& pair : objectiveNames()) {
            if (pair.first == objective) return pair.second;
        }
        return "unknown";
    }

    Objective objectiveFromString(const std::string& name) {
        std::vector<std::string> known;
        for (const auto& pair : objectiveNames()) {
            if (pair.second == name) return pair.first;
            known.push_back(pair.second);
        }
        throw core::InvalidParameterError("objective", fmt::format(
            "unknown objective '{}' (known: {})", name, fmt::join(known, ", ")));
    }

    metrics::MetricValue objectiveValue(Objective objective, const metrics::PerformanceMetrics& m) {
        switch (objective) {
            case Objective::TotalReturn:  return m.total_return;
            case Objective::Cagr:         return m.cagr;
            case Objective::SharpeRatio:  return m.sharpe_ratio;
            case Objective::SortinoRatio: return m.sortino_ratio;
            case Objective::CalmarRatio:  return m.calmar_ratio;
            case Objective::MaxDrawdown:  return m.max_drawdown;
            case Objective::WinRate:      return m.win_rate;
            case Objective::ProfitFactor: return m.profit_factor;
            case Objective::Expectancy:   return m.expectancy;
        }
        return std::nullopt;
    }

} // namespace optimizer

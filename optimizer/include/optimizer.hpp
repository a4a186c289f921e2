#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "price_series.hpp"
#include "interfaces.hpp"
#include "execution_simulator.hpp"
#include "metrics_engine.hpp"
#include "parameter_grid.hpp"
#include "objective.hpp"

namespace optimizer {

    using json = nlohmann::json;

    enum class RunStatus {
        Completed,
        SkippedInvalidParameters,
        SkippedInsufficientData,
        Pruned
    };

    std::string toString(RunStatus status);

    // One evaluated grid combination
    struct SweepOutcome {
        std::size_t combination_index = 0;
        core::ParameterSet parameters;                 // Base parameters with the grid point laid over them
        RunStatus status = RunStatus::Completed;
        std::string message;                           // Why it was skipped
        std::optional<backtester::BacktestResult> result;
        std::optional<metrics::PerformanceMetrics> metrics;
        metrics::MetricValue objective_value;
    };

    struct OptimizerConfig {
        std::size_t num_workers = 1;
        std::optional<std::size_t> max_combinations;   // Evaluate only the first N grid indices
        // Combinations for which this returns false are recorded as Pruned
        std::function<bool(const core::ParameterSet&)> constraint;
        bool retain_results = true;                    // Keep each BacktestResult in the outcome
        // Fixed values every grid point is laid over; grid values win on overlap
        core::ParameterSet base_parameters;

        // Reads num_workers, max_combinations and retain_results.
        // Throws core::ConfigException / core::InvalidParameterError.
        static OptimizerConfig fromJson(const json& j);
    };

    struct OptimizationReport {
        std::string strategy_name;
        Objective objective = Objective::SharpeRatio;
        std::vector<std::string> parameter_names;
        std::size_t grid_size = 0;
        std::size_t evaluated = 0;           // Combinations visited, skipped ones included
        std::size_t capped = 0;              // Cut by max_combinations
        bool halted = false;                 // Stopped by the caller's flag
        std::vector<SweepOutcome> ranked;    // Completed runs, best first
        std::vector<SweepOutcome> skipped;   // Rejected or pruned runs, grid order

        const SweepOutcome* best() const { return ranked.empty() ? nullptr : &ranked.front(); }
    };

    // Orders completed outcomes: defined objective values descending,
    // undefined last, ties by grid index.
    void rankOutcomes(std::vector<SweepOutcome>& outcomes);

    class Optimizer;

    // Lazy, unranked stream of outcomes in grid order. Each next() runs one
    // combination. The series, strategy and optimizer must outlive it.
    class SweepSequence {
    public:
        std::optional<SweepOutcome> next();
        bool done() const { return cursor_ >= limit_; }
        std::size_t total() const { return limit_; }
        // Starts over from the first combination
        void reset() { cursor_ = 0; }

    private:
        friend class Optimizer;
        SweepSequence(const Optimizer& owner,
                      const core::PriceSeries& series,
                      const strategy_engine::IStrategy& strategy,
                      ParameterGrid grid,
                      Objective objective,
                      std::size_t limit);

        const Optimizer* owner_;
        const core::PriceSeries* series_;
        const strategy_engine::IStrategy* strategy_;
        ParameterGrid grid_;
        Objective objective_;
        std::size_t limit_;
        std::size_t cursor_ = 0;
    };

    class Optimizer {
    public:
        // Throws std::invalid_argument if num_workers is zero
        Optimizer(backtester::ExecutionSimulator simulator,
                  metrics::MetricsEngine metrics_engine,
                  OptimizerConfig config = {});

        const OptimizerConfig& getConfig() const { return config_; }

        // Runs every combination (up to max_combinations) and ranks the completed ones.
        // Setting *stop_flag halts the sweep between combinations. DataIntegrityError
        // and any other unexpected exception abort the sweep and are rethrown.
        OptimizationReport optimize(const core::PriceSeries& series,
                                    const strategy_engine::IStrategy& strategy,
                                    const ParameterGrid& grid,
                                    Objective objective,
                                    const std::atomic<bool>* stop_flag = nullptr) const;

        SweepSequence sweep(const core::PriceSeries& series,
                            const strategy_engine::IStrategy& strategy,
                            const ParameterGrid& grid,
                            Objective objective) const;

        // Simulates one combination (laid over the base parameters). Rejected
        // parameters and short data become skip records; everything else propagates.
        SweepOutcome evaluate(const core::PriceSeries& series,
                              const strategy_engine::IStrategy& strategy,
                              const core::ParameterSet& grid_point,
                              std::size_t combination_index,
                              Objective objective) const;

    private:
        backtester::ExecutionSimulator simulator_;
        metrics::MetricsEngine metrics_engine_;
        OptimizerConfig config_;

        std::size_t combinationLimit(const ParameterGrid& grid) const;
        core::ParameterSet withBase(const core::ParameterSet& grid_point) const;
    };

} // namespace optimizer

#include "optimizer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "parameters.hpp" // formatParameters
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

namespace optimizer {

    std::string toString(RunStatus status) {
        switch (status) {
            case RunStatus::Completed:                return "completed";
            case RunStatus::SkippedInvalidParameters: return "skipped_invalid_parameters";
            case RunStatus::SkippedInsufficientData:  return "skipped_insufficient_data";
            case RunStatus::Pruned:                   return "pruned";
        }
        return "unknown";
    }

    OptimizerConfig OptimizerConfig::fromJson(const json& j) {
        if (!j.is_object()) {
            throw core::ConfigException("Optimization config must be a JSON object.");
        }
        OptimizerConfig config;
        if (j.contains("num_workers")) {
            if (!j["num_workers"].is_number_integer() || j["num_workers"].get<long long>() < 1) {
                throw core::InvalidParameterError("num_workers", "must be a positive integer");
            }
            config.num_workers = j["num_workers"].get<std::size_t>();
        }
        if (j.contains("max_combinations") && !j["max_combinations"].is_null()) {
            if (!j["max_combinations"].is_number_integer() || j["max_combinations"].get<long long>() < 0) {
                throw core::InvalidParameterError("max_combinations", "must be a non-negative integer");
            }
            config.max_combinations = j["max_combinations"].get<std::size_t>();
        }
        if (j.contains("retain_results")) {
            if (!j["retain_results"].is_boolean()) {
                throw core::ConfigException("Optimization field 'retain_results' must be a boolean.");
            }
            config.retain_results = j["retain_results"].get<bool>();
        }
        return config;
    }

    void rankOutcomes(std::vector<SweepOutcome>& outcomes) {
        auto defined = [](const SweepOutcome& o) {
            return o.objective_value.has_value() && !std::isnan(*o.objective_value);
        };
        std::stable_sort(outcomes.begin(), outcomes.end(), [&](const SweepOutcome& a, const SweepOutcome& b) {
            bool a_defined = defined(a);
            bool b_defined = defined(b);
            if (a_defined != b_defined) {
                return a_defined;
            }
            if (a_defined && *a.objective_value != *b.objective_value) {
                return *a.objective_value > *b.objective_value;
            }
            return a.combination_index < b.combination_index;
        });
    }

    // --- SweepSequence ---

    SweepSequence::SweepSequence(const Optimizer& owner,
                                 const core::PriceSeries& series,
                                 const strategy_engine::IStrategy& strategy,
                                 ParameterGrid grid,
                                 Objective objective,
                                 std::size_t limit)
        : owner_(&owner), series_(&series), strategy_(&strategy),
          grid_(std::move(grid)), objective_(objective), limit_(limit) {}

    std::optional<SweepOutcome> SweepSequence::next() {
        if (done()) {
            return std::nullopt;
        }
        std::size_t index = cursor_++;
        return owner_->evaluate(*series_, *strategy_, grid_.at(index), index, objective_);
    }

    // --- Optimizer ---

    Optimizer::Optimizer(backtester::ExecutionSimulator simulator,
                         metrics::MetricsEngine metrics_engine,
                         OptimizerConfig config)
        : simulator_(std::move(simulator)), metrics_engine_(std::move(metrics_engine)), config_(std::move(config)) {
        if (config_.num_workers == 0) {
            throw std::invalid_argument("Optimizer needs at least one worker.");
        }
    }

    std::size_t Optimizer::combinationLimit(const ParameterGrid& grid) const {
        std::size_t total = grid.size();
        return config_.max_combinations ? std::min(total, *config_.max_combinations) : total;
    }

    core::ParameterSet Optimizer::withBase(const core::ParameterSet& grid_point) const {
        core::ParameterSet params = config_.base_parameters;
        for (const auto& entry : grid_point) {
            params[entry.first] = entry.second;
        }
        return params;
    }

    SweepOutcome Optimizer::evaluate(const core::PriceSeries& series,
                                     const strategy_engine::IStrategy& strategy,
                                     const core::ParameterSet& grid_point,
                                     std::size_t combination_index,
                                     Objective objective) const
    {
        auto logger = core::logging::getLogger();
        const core::ParameterSet params = withBase(grid_point);
        SweepOutcome outcome;
        outcome.combination_index = combination_index;
        outcome.parameters = params;

        if (config_.constraint && !config_.constraint(params)) {
            outcome.status = RunStatus::Pruned;
            outcome.message = "rejected by constraint";
            logger->debug("Combination {} [{}] pruned.", combination_index, strategy_engine::formatParameters(params));
            return outcome;
        }

        try {
            backtester::BacktestResult result = simulator_.run(series, strategy, params);
            metrics::PerformanceMetrics m = metrics_engine_.compute(result);
            outcome.objective_value = objectiveValue(objective, m);
            outcome.metrics = std::move(m);
            if (config_.retain_results) {
                outcome.result = std::move(result);
            }
            outcome.status = RunStatus::Completed;
            logger->debug("Combination {} [{}]: {} = {}", combination_index,
                strategy_engine::formatParameters(params), toString(objective),
                metrics::formatMetric(outcome.objective_value, 4));
        } catch (const core::InvalidParameterError& e) {
            outcome.status = RunStatus::SkippedInvalidParameters;
            outcome.message = e.what();
            logger->warn("Combination {} [{}] skipped: {}", combination_index,
                strategy_engine::formatParameters(params), e.what());
        } catch (const core::InsufficientDataError& e) {
            outcome.status = RunStatus::SkippedInsufficientData;
            outcome.message = e.what();
            logger->warn("Combination {} [{}] skipped: {}", combination_index,
                strategy_engine::formatParameters(params), e.what());
        }
        return outcome;
    }

    SweepSequence Optimizer::sweep(const core::PriceSeries& series,
                                   const strategy_engine::IStrategy& strategy,
                                   const ParameterGrid& grid,
                                   Objective objective) const
    {
        return SweepSequence(*this, series, strategy, grid, objective, combinationLimit(grid));
    }

    OptimizationReport Optimizer::optimize(const core::PriceSeries& series,
                                           const strategy_engine::IStrategy& strategy,
                                           const ParameterGrid& grid,
                                           Objective objective,
                                           const std::atomic<bool>* stop_flag) const
    {
        auto logger = core::logging::getLogger();

        // Bad shared data spoils every combination, so fail before fanning out
        series.validate();

        const std::size_t total = grid.size();
        const std::size_t limit = combinationLimit(grid);
        const std::size_t workers = std::max<std::size_t>(1, std::min(config_.num_workers, limit));

        logger->info("Optimizing '{}' over {} combinations ({} evaluated, {} workers, objective {}).",
            strategy.getName(), total, limit, workers, toString(objective));

        auto stop_requested = [stop_flag]() {
            return stop_flag != nullptr && stop_flag->load();
        };

        // One slot per combination; each worker writes only the slots it claimed
        std::vector<std::optional<SweepOutcome>> slots(limit);
        std::atomic<std::size_t> next_index{0};
        std::atomic<bool> abort{false};

        auto work = [&]() {
            while (!stop_requested() && !abort.load()) {
                std::size_t index = next_index.fetch_add(1);
                if (index >= limit) {
                    break;
                }
                try {
                    slots[index] = evaluate(series, strategy, grid.at(index), index, objective);
                } catch (...) {
                    abort.store(true);
                    throw;
                }
            }
        };

        if (workers == 1) {
            work();
        } else {
            std::vector<std::future<void>> futures;
            futures.reserve(workers);
            for (std::size_t w = 0; w < workers; ++w) {
                futures.push_back(std::async(std::launch::async, work));
            }
            std::exception_ptr failure;
            for (auto& future : futures) {
                try {
                    future.get();
                } catch (...) {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
            if (failure) {
                logger->error("Optimization of '{}' aborted.", strategy.getName());
                std::rethrow_exception(failure);
            }
        }

        OptimizationReport report;
        report.strategy_name = strategy.getName();
        report.objective = objective;
        report.parameter_names = grid.names();
        report.grid_size = total;
        report.capped = total - limit;

        for (auto& slot : slots) {
            if (!slot) {
                report.halted = true;
                continue;
            }
            report.evaluated++;
            if (slot->status == RunStatus::Completed) {
                report.ranked.push_back(std::move(*slot));
            } else {
                report.skipped.push_back(std::move(*slot));
            }
        }
        rankOutcomes(report.ranked);

        if (report.halted) {
            logger->warn("Optimization of '{}' halted after {} of {} combinations.",
                report.strategy_name, report.evaluated, limit);
        }
        const SweepOutcome* best = report.best();
        logger->info("Optimization finished: {} completed, {} skipped. Best: {}",
            report.ranked.size(), report.skipped.size(),
            best ? fmt::format("[{}] {} = {}", strategy_engine::formatParameters(best->parameters),
                               toString(objective), metrics::formatMetric(best->objective_value, 4))
                 : std::string("none"));
        return report;
    }

} // namespace optimizer

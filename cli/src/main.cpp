// cli/src/main.cpp

#include <iostream>
#include <string>
#include <exception>
#include <fstream>
#include <memory>
#include <optional>
#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "price_series.hpp"
#include "csv_bar_reader.hpp"
#include "bar_cache.hpp"
#include "strategy_registry.hpp"
#include "parameters.hpp"
#include "backtest_config.hpp"
#include "execution_simulator.hpp"
#include "metrics_engine.hpp"
#include "result_export.hpp"
#include "parameter_grid.hpp"
#include "optimizer.hpp"
#include "optimization_export.hpp"

using json = nlohmann::json;

namespace {

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " <run-config.json>\n\nAvailable strategies:\n";
        for (const auto& entry : strategy_engine::StrategyRegistry::withBuiltins().describeAll()) {
            std::cerr << "  " << entry.first << "  " << entry.second << "\n";
        }
    }

    json loadRunConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open run config: {}", path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Invalid JSON in {}: {}", path, e.what()));
        }
    }

    std::string requireString(const json& section, const char* key, const char* section_name) {
        if (!section.contains(key) || !section[key].is_string()) {
            throw core::ConfigException(fmt::format("'{}.{}' must be a string.", section_name, key));
        }
        return section[key].get<std::string>();
    }

    // CSV read, going through the bar cache when one is configured
    core::PriceSeries loadSeries(const json& data_config) {
        auto logger = core::logging::getLogger();
        std::string csv_path = requireString(data_config, "csv", "data");
        std::string symbol = data_config.value("symbol", std::string("UNKNOWN"));
        std::string interval = data_config.value("interval", std::string("1d"));

        std::optional<core::PriceSeries> series;
        std::unique_ptr<data::BarCache> cache;

        if (data_config.contains("cache_db")) {
            auto ttl = std::chrono::seconds(data_config.value("cache_ttl_seconds", 86400LL));
            cache = std::make_unique<data::BarCache>(requireString(data_config, "cache_db", "data"), ttl);
            if (cache->connect() && cache->initializeSchema()) {
                series = cache->loadFromSource(symbol, interval, csv_path);
            } else {
                logger->warn("Bar cache unavailable; reading CSV directly.");
                cache.reset();
            }
        }

        if (!series) {
            data::CsvReadOptions options;
            options.skip_invalid_rows = data_config.value("skip_invalid_rows", false);
            series = data::CsvBarReader(options).readFile(csv_path, symbol, interval);
            if (cache) {
                try {
                    cache->store(*series, csv_path);
                } catch (const core::DataLoadException& e) {
                    logger->warn("Bars not cached: {}", e.what());
                }
            }
        }

        if (series->empty()) {
            throw core::DataLoadException(fmt::format("No bars found in {}.", csv_path));
        }

        if (data_config.contains("start") || data_config.contains("end")) {
            core::Timestamp start = data_config.contains("start")
                ? core::utils::stringToTimestamp(requireString(data_config, "start", "data"))
                : series->getBars().front().timestamp;
            core::Timestamp end = data_config.contains("end")
                ? core::utils::stringToTimestamp(requireString(data_config, "end", "data"))
                : series->getBars().back().timestamp;
            series = series->slice(start, end);
        }

        logger->info("Loaded {} bars for {} ({}).", series->size(), symbol, interval);
        return *series;
    }

    void runBacktest(const core::PriceSeries& series,
                     const strategy_engine::StrategySelection& selection,
                     const backtester::ExecutionSimulator& simulator,
                     const metrics::MetricsEngine& metrics_engine,
                     const std::string& output_dir)
    {
        auto logger = core::logging::getLogger();
        logger->info("Backtesting '{}' [{}]", selection.strategy->getName(),
            strategy_engine::formatParameters(selection.parameters));

        backtester::BacktestResult result = simulator.run(series, *selection.strategy, selection.parameters);
        metrics::PerformanceMetrics performance = metrics_engine.compute(result);
        performance.logMetrics();

        std::string stem = fmt::format("{}_{}", result.strategy_name, result.symbol);
        reporting::exportAll(output_dir, stem, result, performance);
    }

    void runOptimization(const core::PriceSeries& series,
                         const strategy_engine::StrategySelection& selection,
                         const backtester::ExecutionSimulator& simulator,
                         const metrics::MetricsEngine& metrics_engine,
                         const json& optimization_config,
                         const std::string& output_dir)
    {
        auto logger = core::logging::getLogger();
        if (!optimization_config.contains("grid")) {
            throw core::ConfigException("'optimization.grid' is required.");
        }
        optimizer::ParameterGrid grid = optimizer::ParameterGrid::fromJson(optimization_config["grid"]);
        optimizer::Objective objective = optimizer::objectiveFromString(
            optimization_config.value("objective", std::string("sharpe_ratio")));
        optimizer::OptimizerConfig config = optimizer::OptimizerConfig::fromJson(optimization_config);
        config.retain_results = false;
        // Configured strategy parameters stay fixed unless the grid varies them
        config.base_parameters = selection.parameters;
        logger->info("Base parameters: [{}]", strategy_engine::formatParameters(config.base_parameters));

        optimizer::Optimizer opt(simulator, metrics_engine, config);
        optimizer::OptimizationReport report = opt.optimize(series, *selection.strategy, grid, objective);

        std::size_t shown = std::min<std::size_t>(10, report.ranked.size());
        for (std::size_t i = 0; i < shown; ++i) {
            const auto& outcome = report.ranked[i];
            logger->info("#{:<3} {} = {:>10}  [{}]", i + 1, optimizer::toString(objective),
                metrics::formatMetric(outcome.objective_value, 4),
                strategy_engine::formatParameters(outcome.parameters));
        }

        std::string stem = fmt::format("optimization_{}_{}", report.strategy_name, series.getSymbol());
        optimizer::writeReportCsv(output_dir + "/" + stem + ".csv", report);
        optimizer::writeReportJson(output_dir + "/" + stem + ".json", report);
        logger->info("Optimization results written to {}", output_dir);
    }

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        printUsage(argv[0]);
        return 2;
    }

    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        json run_config = loadRunConfig(argv[1]);

        spdlog::level::level_enum console_level =
            core::logging::level_from_string(run_config.value("log_level", std::string("info")));
        core::logging::initialize("backtester_cli", console_level, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Strategy backtester starting with {}", argv[1]);

        backtester::BacktestConfig backtest_config = run_config.contains("backtest")
            ? backtester::BacktestConfig::fromJson(run_config["backtest"])
            : backtester::BacktestConfig{};
        metrics::MetricsConfig metrics_config = run_config.contains("metrics")
            ? metrics::MetricsConfig::fromJson(run_config["metrics"])
            : metrics::MetricsConfig{};

        if (!run_config.contains("data")) {
            throw core::ConfigException("'data' section is required.");
        }
        if (!run_config.contains("strategy")) {
            throw core::ConfigException("'strategy' section is required.");
        }

        std::string output_dir = "reports";
        if (run_config.contains("output")) {
            output_dir = run_config["output"].value("directory", output_dir);
        }

        auto registry = strategy_engine::StrategyRegistry::withBuiltins();
        auto selection = registry.select(run_config["strategy"]);
        core::PriceSeries series = loadSeries(run_config["data"]);

        backtester::ExecutionSimulator simulator(backtest_config);
        metrics::MetricsEngine metrics_engine(metrics_config);

        if (run_config.contains("optimization")) {
            runOptimization(series, selection, simulator, metrics_engine, run_config["optimization"], output_dir);
        } else {
            runBacktest(series, selection, simulator, metrics_engine, output_dir);
        }

        logger->info("Strategy backtester finished.");

    } catch (const core::InsufficientDataError& ex) {
        std::cerr << "Insufficient data: need " << ex.requiredBars() << " bars, have " << ex.availableBars() << std::endl;
        if (logger) logger->critical("{}", ex.what());
        return 1;
    } catch (const core::BacktesterException& ex) {
        std::cerr << "Backtester Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtester Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}

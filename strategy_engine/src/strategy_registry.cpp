#include "strategy_registry.hpp"
#include "sma_crossover_strategy.hpp"
#include "ema_crossover_strategy.hpp"
#include "rsi_reversal_strategy.hpp"
#include "macd_strategy.hpp"
#include "bollinger_bands_strategy.hpp"
#include "breakout_strategy.hpp"
#include "mean_reversion_strategy.hpp"
#include "momentum_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace strategy_engine {

    void StrategyRegistry::registerStrategy(std::shared_ptr<const IStrategy> strategy) {
        if (!strategy) {
            throw std::invalid_argument("Cannot register a null strategy.");
        }
        std::string name = strategy->getName();
        if (strategies_.count(name) > 0) {
            throw std::invalid_argument(fmt::format("Strategy '{}' is already registered.", name));
        }
        strategies_.emplace(std::move(name), std::move(strategy));
    }

    bool StrategyRegistry::contains(const std::string& name) const {
        return strategies_.count(name) > 0;
    }

    std::shared_ptr<const IStrategy> StrategyRegistry::get(const std::string& name) const {
        auto it = strategies_.find(name);
        if (it == strategies_.end()) {
            throw core::InvalidParameterError("strategy", fmt::format(
                "unknown strategy '{}' (available: {})", name, fmt::join(names(), ", ")));
        }
        return it->second;
    }

    std::vector<std::string> StrategyRegistry::names() const {
        std::vector<std::string> result;
        result.reserve(strategies_.size());
        for (const auto& pair : strategies_) {
            result.push_back(pair.first);
        }
        return result;
    }

    std::map<std::string, std::string> StrategyRegistry::describeAll() const {
        std::map<std::string, std::string> result;
        for (const auto& pair : strategies_) {
            result[pair.first] = pair.second->getDescription();
        }
        return result;
    }

    StrategySelection StrategyRegistry::select(const json& config) const {
        if (!config.is_object() || !config.contains("name") || !config["name"].is_string()) {
            throw core::ConfigException("Strategy config must be an object with a string 'name'.");
        }

        StrategySelection selection;
        selection.strategy = get(config["name"].get<std::string>());

        core::ParameterSet overrides;
        if (config.contains("parameters")) {
            overrides = parameterSetFromJson(config["parameters"]);
        }
        selection.parameters = selection.strategy->resolveParameters(overrides);

        core::logging::getLogger()->debug("Selected strategy '{}' with {} parameters.",
            selection.strategy->getName(), selection.parameters.size());
        return selection;
    }

    StrategyRegistry StrategyRegistry::withBuiltins() {
        StrategyRegistry registry;
        registry.registerStrategy(std::make_shared<SmaCrossoverStrategy>());
        registry.registerStrategy(std::make_shared<EmaCrossoverStrategy>());
        registry.registerStrategy(std::make_shared<RsiReversalStrategy>());
        registry.registerStrategy(std::make_shared<MacdStrategy>());
        registry.registerStrategy(std::make_shared<BollingerBandsStrategy>());
        registry.registerStrategy(std::make_shared<BreakoutStrategy>());
        registry.registerStrategy(std::make_shared<MeanReversionStrategy>());
        registry.registerStrategy(std::make_shared<MomentumStrategy>());
        return registry;
    }

    core::ParameterSet parameterSetFromJson(const json& object) {
        if (!object.is_object()) {
            throw core::ConfigException("Strategy 'parameters' must be a JSON object.");
        }
        core::ParameterSet params;
        for (auto it = object.begin(); it != object.end(); ++it) {
            if (!it.value().is_number()) {
                throw core::ConfigException(fmt::format("Parameter '{}' must be numeric.", it.key()));
            }
            params[it.key()] = it.value().get<double>();
        }
        return params;
    }

} // namespace strategy_engine

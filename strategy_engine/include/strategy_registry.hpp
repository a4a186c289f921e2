#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    // A strategy picked by name together with its resolved parameters
    struct StrategySelection {
        std::shared_ptr<const IStrategy> strategy;
        core::ParameterSet parameters;
    };

    class StrategyRegistry {
    public:
        // Throws std::invalid_argument on a null strategy or a duplicate name
        void registerStrategy(std::shared_ptr<const IStrategy> strategy);

        bool contains(const std::string& name) const;

        // Throws core::InvalidParameterError("strategy", ...) for unknown names
        std::shared_ptr<const IStrategy> get(const std::string& name) const;

        std::vector<std::string> names() const;

        // name -> description
        std::map<std::string, std::string> describeAll() const;

        // Reads {"name": "...", "parameters": {...}} and resolves the parameters.
        // Throws core::ConfigException on malformed JSON values.
        StrategySelection select(const json& config) const;

        // Registry holding the eight reference strategies
        static StrategyRegistry withBuiltins();

    private:
        std::map<std::string, std::shared_ptr<const IStrategy>> strategies_;
    };

    // Parses a {"name": number} object into a ParameterSet.
    // Throws core::ConfigException for non-numeric values.
    core::ParameterSet parameterSetFromJson(const json& object);

} // namespace strategy_engine

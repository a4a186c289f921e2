#include "parameters.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <limits>
#include <vector>

namespace strategy_engine {

    core::ParameterSet mergeParameters(const std::string& strategy_name,
                                       const core::ParameterSet& defaults,
                                       const core::ParameterSet& overrides)
    {
        core::ParameterSet merged = defaults;
        for (const auto& pair : overrides) {
            if (defaults.find(pair.first) == defaults.end()) {
                std::vector<std::string> known;
                for (const auto& def : defaults) known.push_back(def.first);
                throw core::InvalidParameterError(pair.first, fmt::format(
                    "not a parameter of strategy '{}' (known: {})", strategy_name, fmt::join(known, ", ")));
            }
            merged[pair.first] = pair.second;
        }
        return merged;
    }

    double numericParameter(const core::ParameterSet& params, const std::string& name) {
        auto it = params.find(name);
        if (it == params.end()) {
            throw core::InvalidParameterError(name, "missing");
        }
        if (!std::isfinite(it->second)) {
            throw core::InvalidParameterError(name, fmt::format("must be finite, got {}", it->second));
        }
        return it->second;
    }

    int integerParameter(const core::ParameterSet& params, const std::string& name, int min_value) {
        double value = numericParameter(params, name);
        if (std::floor(value) != value || value > static_cast<double>(std::numeric_limits<int>::max())) {
            throw core::InvalidParameterError(name, fmt::format("must be a whole number, got {}", value));
        }
        if (value < min_value) {
            throw core::InvalidParameterError(name, fmt::format("must be at least {}, got {}", min_value, value));
        }
        return static_cast<int>(value);
    }

    double boundedParameter(const core::ParameterSet& params, const std::string& name,
                            double lower, double upper)
    {
        double value = numericParameter(params, name);
        if (!(value > lower && value < upper)) {
            throw core::InvalidParameterError(name, fmt::format("must lie in ({}, {}), got {}", lower, upper, value));
        }
        return value;
    }

    std::string formatParameters(const core::ParameterSet& params) {
        std::vector<std::string> parts;
        parts.reserve(params.size());
        for (const auto& pair : params) {
            parts.push_back(fmt::format("{}={}", pair.first, pair.second));
        }
        return fmt::format("{}", fmt::join(parts, ", "));
    }

} // namespace strategy_engine

#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace optimizer {

    using json = nlohmann::json;

    // Cartesian product of candidate values, enumerated by index without
    // materializing the combinations. The last parameter varies fastest.
    class ParameterGrid {
    public:
        // Throws std::invalid_argument on a duplicate name or an empty value list
        ParameterGrid& addParameter(const std::string& name, std::vector<double> values);

        // Accepts {"name": [values], ...} (keys in lexicographic order) or
        // [{"name": "...", "values": [...]}, ...] (order as listed).
        // Throws core::ConfigException on malformed input.
        static ParameterGrid fromJson(const json& j);

        const std::vector<std::string>& names() const { return names_; }
        const std::vector<double>& values(std::size_t param_index) const { return values_.at(param_index); }
        bool empty() const { return names_.empty(); }

        // Number of combinations; a grid without parameters has exactly one
        std::size_t size() const;

        // Throws std::out_of_range if index >= size()
        core::ParameterSet at(std::size_t index) const;

    private:
        std::vector<std::string> names_;
        std::vector<std::vector<double>> values_;
    };

} // namespace optimizer

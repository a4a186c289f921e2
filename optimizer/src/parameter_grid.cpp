#include "parameter_grid.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace optimizer {

    namespace {

        std::vector<double> readValues(const json& array, const std::string& name) {
            if (!array.is_array() || array.empty()) {
                throw core::ConfigException(fmt::format("Grid values for '{}' must be a non-empty array.", name));
            }
            std::vector<double> values;
            for (const auto& v : array) {
                if (!v.is_number()) {
                    throw core::ConfigException(fmt::format("Grid value for '{}' must be numeric.", name));
                }
                values.push_back(v.get<double>());
            }
            return values;
        }

    } // namespace

    ParameterGrid& ParameterGrid::addParameter(const std::string& name, std::vector<double> values) {
        if (values.empty()) {
            throw std::invalid_argument(fmt::format("Grid parameter '{}' has no candidate values.", name));
        }
        if (std::find(names_.begin(), names_.end(), name) != names_.end()) {
            throw std::invalid_argument(fmt::format("Grid parameter '{}' was added twice.", name));
        }
        names_.push_back(name);
        values_.push_back(std::move(values));
        return *this;
    }

    ParameterGrid ParameterGrid::fromJson(const json& j) {
        ParameterGrid grid;
        try {
            if (j.is_object()) {
                for (auto it = j.begin(); it != j.end(); ++it) {
                    grid.addParameter(it.key(), readValues(it.value(), it.key()));
                }
            } else if (j.is_array()) {
                for (const auto& entry : j) {
                    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() || !entry.contains("values")) {
                        throw core::ConfigException("Grid entries must look like {\"name\": ..., \"values\": [...]}.");
                    }
                    std::string name = entry["name"].get<std::string>();
                    grid.addParameter(name, readValues(entry["values"], name));
                }
            } else {
                throw core::ConfigException("Parameter grid must be a JSON object or array.");
            }
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(e.what());
        }
        return grid;
    }

    std::size_t ParameterGrid::size() const {
        std::size_t total = 1;
        for (const auto& values : values_) {
            if (total > std::numeric_limits<std::size_t>::max() / values.size()) {
                throw std::overflow_error("Parameter grid has too many combinations to index.");
            }
            total *= values.size();
        }
        return total;
    }

    core::ParameterSet ParameterGrid::at(std::size_t index) const {
        if (index >= size()) {
            throw std::out_of_range(fmt::format("Combination {} is beyond grid of {}.", index, size()));
        }
        core::ParameterSet params;
        std::size_t remainder = index;
        for (std::size_t k = names_.size(); k-- > 0;) {
            const auto& values = values_[k];
            params[names_[k]] = values[remainder % values.size()];
            remainder /= values.size();
        }
        return params;
    }

} // namespace optimizer

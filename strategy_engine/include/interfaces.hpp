#pragma once

#include <string>
#include <cstddef>

#include "datatypes.hpp"    // Signal, ParameterSet
#include "price_series.hpp" // BarWindow

namespace strategy_engine {

    // --- Strategy Interface ---
    // A strategy is a stateless function of the trailing window and its
    // parameters. Implementations must not keep state between calls; one
    // instance is shared by every run of an optimization sweep.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Unique registry name (e.g., "sma_crossover")
        virtual std::string getName() const = 0;

        // One-line human readable summary
        virtual std::string getDescription() const = 0;

        virtual core::ParameterSet defaultParameters() const = 0;

        // Merges `overrides` onto the defaults and validates the result.
        // Throws core::InvalidParameterError for unknown names, non-integer
        // periods, out-of-range values or inconsistent combinations.
        virtual core::ParameterSet resolveParameters(const core::ParameterSet& overrides) const = 0;

        // Minimum number of bars the window must hold before generateSignal
        // is consulted. `params` must come from resolveParameters.
        virtual std::size_t getLookback(const core::ParameterSet& params) const = 0;

        // Signal for the newest bar of `window`.
        virtual core::Signal generateSignal(const core::BarWindow& window,
                                            const core::ParameterSet& params) const = 0;
    };

} // namespace strategy_engine

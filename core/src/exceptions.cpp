#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace core {

    InsufficientDataError::InsufficientDataError(std::size_t required_bars, std::size_t available_bars)
        : BacktesterException(fmt::format(
              "Insufficient data: strategy requires at least {} bars, series has {}.",
              required_bars, available_bars)),
          required_bars_(required_bars),
          available_bars_(available_bars) {}

    InvalidParameterError::InvalidParameterError(std::string parameter, const std::string& message)
        : BacktesterException(fmt::format("Invalid parameter '{}': {}", parameter, message)),
          parameter_(std::move(parameter)) {}

    DataIntegrityError::DataIntegrityError(std::size_t bar_index, const std::string& message)
        : BacktesterException(fmt::format("Data integrity violation at bar {}: {}", bar_index, message)),
          bar_index_(bar_index) {}

} // namespace core

#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace core {

    class BacktesterException : public std::runtime_error {
    public:
        explicit BacktesterException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktesterException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    class DataLoadException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    class IndicatorCalculationException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    class BacktestException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    // Series shorter than the strategy's declared lookback
    class InsufficientDataError : public BacktesterException {
    public:
        InsufficientDataError(std::size_t required_bars, std::size_t available_bars);

        std::size_t requiredBars() const { return required_bars_; }
        std::size_t availableBars() const { return available_bars_; }

    private:
        std::size_t required_bars_;
        std::size_t available_bars_;
    };

    // Malformed or inconsistent strategy / run parameters
    class InvalidParameterError : public BacktesterException {
    public:
        InvalidParameterError(std::string parameter, const std::string& message);

        const std::string& parameter() const { return parameter_; }

    private:
        std::string parameter_;
    };

    // Upstream data defect: non-monotonic timestamps, NaN or non-positive prices
    class DataIntegrityError : public BacktesterException {
    public:
        DataIntegrityError(std::size_t bar_index, const std::string& message);

        std::size_t barIndex() const { return bar_index_; }

    private:
        std::size_t bar_index_;
    };

} // namespace core

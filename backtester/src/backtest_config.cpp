#include "backtest_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace backtester {

    namespace {

        double readNumber(const json& j, const char* key, double fallback) {
            if (!j.contains(key) || j[key].is_null()) {
                return fallback;
            }
            if (!j[key].is_number()) {
                throw core::ConfigException(fmt::format("Backtest config field '{}' must be a number.", key));
            }
            return j[key].get<double>();
        }

        std::optional<double> readOptionalNumber(const json& j, const char* key) {
            if (!j.contains(key) || j[key].is_null()) {
                return std::nullopt;
            }
            return readNumber(j, key, 0.0);
        }

        void requireFinite(double value, const char* name) {
            if (!std::isfinite(value)) {
                throw core::InvalidParameterError(name, fmt::format("must be finite, got {}", value));
            }
        }

    } // namespace

    std::string toString(RiskExitPriority priority) {
        return priority == RiskExitPriority::StopLossFirst ? "stop_loss_first" : "take_profit_first";
    }

    RiskExitPriority riskExitPriorityFromString(const std::string& value) {
        if (value == "stop_loss_first") return RiskExitPriority::StopLossFirst;
        if (value == "take_profit_first") return RiskExitPriority::TakeProfitFirst;
        throw core::InvalidParameterError("risk_exit_priority", fmt::format(
            "expected 'stop_loss_first' or 'take_profit_first', got '{}'", value));
    }

    void BacktestConfig::validate() const {
        requireFinite(initial_capital, "initial_capital");
        if (initial_capital <= 0.0) {
            throw core::InvalidParameterError("initial_capital", fmt::format("must be positive, got {}", initial_capital));
        }
        requireFinite(commission_rate, "commission_rate");
        if (commission_rate < 0.0 || commission_rate >= 1.0) {
            throw core::InvalidParameterError("commission_rate", fmt::format("must lie in [0, 1), got {}", commission_rate));
        }
        requireFinite(slippage_rate, "slippage_rate");
        if (slippage_rate < 0.0 || slippage_rate >= 1.0) {
            throw core::InvalidParameterError("slippage_rate", fmt::format("must lie in [0, 1), got {}", slippage_rate));
        }
        requireFinite(max_position_fraction, "max_position_fraction");
        if (max_position_fraction <= 0.0 || max_position_fraction > 1.0) {
            throw core::InvalidParameterError("max_position_fraction", fmt::format("must lie in (0, 1], got {}", max_position_fraction));
        }
        if (stop_loss_fraction) {
            requireFinite(*stop_loss_fraction, "stop_loss_fraction");
            if (*stop_loss_fraction <= 0.0 || *stop_loss_fraction >= 1.0) {
                throw core::InvalidParameterError("stop_loss_fraction", fmt::format("must lie in (0, 1), got {}", *stop_loss_fraction));
            }
        }
        if (take_profit_fraction) {
            requireFinite(*take_profit_fraction, "take_profit_fraction");
            if (*take_profit_fraction <= 0.0) {
                throw core::InvalidParameterError("take_profit_fraction", fmt::format("must be positive, got {}", *take_profit_fraction));
            }
        }
    }

    BacktestConfig BacktestConfig::fromJson(const json& j) {
        if (!j.is_object()) {
            throw core::ConfigException("Backtest config must be a JSON object.");
        }
        BacktestConfig config;
        config.initial_capital = readNumber(j, "initial_capital", config.initial_capital);
        config.commission_rate = readNumber(j, "commission_rate", config.commission_rate);
        config.slippage_rate = readNumber(j, "slippage_rate", config.slippage_rate);
        config.max_position_fraction = readNumber(j, "max_position_fraction", config.max_position_fraction);
        config.stop_loss_fraction = readOptionalNumber(j, "stop_loss_fraction");
        config.take_profit_fraction = readOptionalNumber(j, "take_profit_fraction");
        if (j.contains("risk_exit_priority")) {
            if (!j["risk_exit_priority"].is_string()) {
                throw core::ConfigException("Backtest config field 'risk_exit_priority' must be a string.");
            }
            config.risk_exit_priority = riskExitPriorityFromString(j["risk_exit_priority"].get<std::string>());
        }
        config.validate();
        return config;
    }

    json BacktestConfig::toJson() const {
        json j;
        j["initial_capital"] = initial_capital;
        j["commission_rate"] = commission_rate;
        j["slippage_rate"] = slippage_rate;
        j["max_position_fraction"] = max_position_fraction;
        j["stop_loss_fraction"] = stop_loss_fraction ? json(*stop_loss_fraction) : json(nullptr);
        j["take_profit_fraction"] = take_profit_fraction ? json(*take_profit_fraction) : json(nullptr);
        j["risk_exit_priority"] = toString(risk_exit_priority);
        return j;
    }

} // namespace backtester

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of an application (e.g., in main()).
    // Logs to the console and to a rotating file under logs/.
    void initialize(const std::string& base_log_filename = "strategy_backtester",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Console-only variant for tests and short-lived tools
    void initializeConsole(spdlog::level::level_enum console_level = spdlog::level::warn);

    // Get the globally configured logger. Throws if neither initializer has run.
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/config)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core

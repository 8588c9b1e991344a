#pragma once

#include <string>

namespace rv {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

/**
 * @brief Apply level and pattern to spdlog's default logger
 *
 * RV_LOG_LEVEL in the environment wins over the configured level.
 * Unknown level names fall back to info.
 */
void configure_logging(const LoggingConfig& config);

} // namespace rv

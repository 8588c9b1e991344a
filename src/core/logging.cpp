#include "rv/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace rv {

void configure_logging(const LoggingConfig& config) {
    std::string level_name = config.level;
    if (const char* env = std::getenv("RV_LOG_LEVEL")) {
        level_name = env;
    }

    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::warn("Unknown log level '{}', using info", level_name);
        level = spdlog::level::info;
    }

    spdlog::set_level(level);
    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
}

} // namespace rv

#include "jsonedit++/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace jsonedit {

static constexpr const char* LOGGER_NAME = "jsonedit";

static std::shared_ptr<spdlog::logger> create_logger() {
    // Another component may already have registered the name.
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto new_logger = spdlog::stderr_color_mt(LOGGER_NAME);
    new_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    new_logger->set_level(spdlog::level::warn);
    return new_logger;
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace jsonedit

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace jsonedit {

/**
 * Library logger, named "jsonedit". Created on first use with a colored stderr sink (stdout may carry
 * the transformed document) and level warn.
 */
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace jsonedit

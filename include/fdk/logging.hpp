#pragma once
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace fdk {

/// Shared "fdk" logger, writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Set the logger's level from a name: trace, debug, info, warn,
/// error, critical or off. Throws ConfigError on anything else.
void set_log_level(const std::string& level);

} // namespace fdk

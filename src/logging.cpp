#include "fdk/logging.hpp"
#include "fdk/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fdk {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("fdk")) return existing;
        auto created = spdlog::stderr_color_mt("fdk");
        created->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%l] %v");
        return created;
    }();
    return instance;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off as well
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace fdk

#include "fdk/config.hpp"
#include "fdk/error.hpp"
#include "fdk/version.hpp"
#include <charconv>
#include <cstring>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace fdk {

namespace {

constexpr std::string_view UNIX_PREFIX = "unix:";

std::string value_or_empty(const std::map<std::string, std::string>& env, const std::string& key) {
    auto it = env.find(key);
    return it == env.end() ? std::string() : it->second;
}

} // anonymous namespace

RuntimeConfig RuntimeConfig::from_environment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (!eq) continue;
        env.emplace(std::string(*entry, static_cast<std::size_t>(eq - *entry)), std::string(eq + 1));
    }
    return from_map(std::move(env));
}

RuntimeConfig RuntimeConfig::from_map(std::map<std::string, std::string> env) {
    RuntimeConfig cfg;

    std::string format = value_or_empty(env, "FN_FORMAT");
    if (!format.empty() && format != FN_FORMAT) {
        throw ConfigError("Unsupported FN_FORMAT '" + format + "', only '"
                          + std::string(FN_FORMAT) + "' is supported");
    }

    std::string listener = value_or_empty(env, "FN_LISTENER");
    if (listener.empty()) {
        throw ConfigError("FN_LISTENER is not set");
    }
    if (listener.compare(0, UNIX_PREFIX.size(), UNIX_PREFIX) != 0
        || listener.size() == UNIX_PREFIX.size()) {
        throw ConfigError("FN_LISTENER must be of the form unix:<path>, got '" + listener + "'");
    }
    cfg.listener = listener.substr(UNIX_PREFIX.size());

    cfg.app_id = value_or_empty(env, "FN_APP_ID");
    cfg.fn_id = value_or_empty(env, "FN_FN_ID");
    cfg.app_name = value_or_empty(env, "FN_APP_NAME");
    cfg.fn_name = value_or_empty(env, "FN_FN_NAME");

    std::string memory = value_or_empty(env, "FN_MEMORY");
    if (!memory.empty()) {
        auto [ptr, ec] = std::from_chars(memory.data(), memory.data() + memory.size(), cfg.memory_mb);
        if (ec != std::errc() || ptr != memory.data() + memory.size()) {
            throw ConfigError("FN_MEMORY must be a number of megabytes, got '" + memory + "'");
        }
    }

    std::string level = value_or_empty(env, "FDK_LOG_LEVEL");
    if (!level.empty()) cfg.log_level = level;

    cfg.values = std::move(env);
    return cfg;
}

std::optional<std::string> RuntimeConfig::get(const std::string& key) const {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

} // namespace fdk

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace fdk {

/// Function container settings handed over by the platform through the
/// environment (FN_* variables).
struct RuntimeConfig {
    std::string format{"http-stream"};
    std::string listener;   // socket path, "unix:" prefix stripped
    std::string app_id;
    std::string fn_id;
    std::string app_name;
    std::string fn_name;
    uint64_t memory_mb = 0;
    std::string log_level{"info"};
    // Every variable, FN_* included, is function configuration
    std::map<std::string, std::string> values;

    /// Load from the process environment.
    /// Throws ConfigError on an unsupported FN_FORMAT or a missing or
    /// malformed FN_LISTENER.
    [[nodiscard]] static RuntimeConfig from_environment();

    /// Same rules as from_environment, over an explicit variable map.
    [[nodiscard]] static RuntimeConfig from_map(std::map<std::string, std::string> env);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
};

} // namespace fdk

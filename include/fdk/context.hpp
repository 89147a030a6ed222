#pragma once
#include "config.hpp"
#include <map>
#include <optional>
#include <string>

namespace fdk {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

/// Per-call view of the runtime: configuration, request headers, and
/// the response headers and gateway status the handler wants sent back.
class RuntimeContext {
public:
    RuntimeContext(const RuntimeConfig& config, Headers request_headers);

    [[nodiscard]] const RuntimeConfig& config() const { return config_; }
    [[nodiscard]] std::optional<std::string> config_value(const std::string& key) const;

    [[nodiscard]] const std::string& app_id() const { return config_.app_id; }
    [[nodiscard]] const std::string& fn_id() const { return config_.fn_id; }
    [[nodiscard]] const std::string& app_name() const { return config_.app_name; }
    [[nodiscard]] const std::string& fn_name() const { return config_.fn_name; }

    /// Fn-Call-Id, empty when absent.
    [[nodiscard]] const std::string& call_id() const { return call_id_; }
    /// Fn-Deadline as sent (RFC 3339), empty when absent.
    [[nodiscard]] const std::string& deadline() const { return deadline_; }

    /// First value of a request header, matched case-insensitively.
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
    [[nodiscard]] const Headers& headers() const { return request_headers_; }

    /// Header forwarded by the HTTP gateway (sent as Fn-Http-H-<name>).
    [[nodiscard]] std::optional<std::string> http_header(const std::string& name) const;

    void add_response_header(const std::string& name, const std::string& value);
    [[nodiscard]] const Headers& response_headers() const { return response_headers_; }

    /// Status the HTTP gateway should answer with (sent as Fn-Http-Status).
    void set_http_status(int status) { http_status_ = status; }
    [[nodiscard]] std::optional<int> http_status() const { return http_status_; }

private:
    const RuntimeConfig& config_;
    Headers request_headers_;
    Headers response_headers_;
    std::string call_id_;
    std::string deadline_;
    std::optional<int> http_status_;
};

} // namespace fdk

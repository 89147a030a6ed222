#include "fdk/context.hpp"
#include <algorithm>
#include <cctype>

namespace fdk {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

RuntimeContext::RuntimeContext(const RuntimeConfig& config, Headers request_headers)
    : config_(config)
    , request_headers_(std::move(request_headers)) {
    call_id_ = header("Fn-Call-Id").value_or("");
    deadline_ = header("Fn-Deadline").value_or("");
}

std::optional<std::string> RuntimeContext::config_value(const std::string& key) const {
    return config_.get(key);
}

std::optional<std::string> RuntimeContext::header(const std::string& name) const {
    // find() may land on any duplicate; lower_bound is the first one sent
    auto it = request_headers_.lower_bound(name);
    if (it == request_headers_.end() || request_headers_.key_comp()(name, it->first)) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> RuntimeContext::http_header(const std::string& name) const {
    return header("Fn-Http-H-" + name);
}

void RuntimeContext::add_response_header(const std::string& name, const std::string& value) {
    response_headers_.emplace(name, value);
}

} // namespace fdk

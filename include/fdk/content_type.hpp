#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace fdk {

/// Payload formats understood by the coercion layer.
enum class ContentType {
    JSON,
    YAML,
    XML,
    Plain,
    URLEncoded,
};

/// What to do with an inbound MIME string that is not in the table.
enum class ContentTypePolicy {
    FallbackToJson,
    Reject,
};

namespace mime {
    constexpr std::string_view JSON      = "application/json";
    constexpr std::string_view TEXT      = "text/plain";
    constexpr std::string_view FORM      = "application/x-www-form-urlencoded";
    constexpr std::string_view XML_TEXT  = "text/xml";
    constexpr std::string_view XML_APP   = "application/xml";
    constexpr std::string_view YAML_TEXT = "text/yaml";
    constexpr std::string_view YAML_APP  = "application/yaml";
} // namespace mime

/// Classify an inbound MIME string. Exact, case-sensitive match;
/// anything unrecognized (including "") is JSON. Never throws.
[[nodiscard]] ContentType content_type_from_string(std::string_view s) noexcept;

/// Same lookup, but under ContentTypePolicy::Reject an unrecognized
/// string throws CoercionError instead of falling back to JSON.
[[nodiscard]] ContentType content_type_from_string(std::string_view s, ContentTypePolicy policy);

/// Canonical outbound MIME for the response Content-Type header.
[[nodiscard]] std::string content_type_to_header(ContentType t);

/// Variant name, for logs.
[[nodiscard]] std::string_view content_type_name(ContentType t) noexcept;

void to_json(nlohmann::json& j, ContentType t);
void from_json(const nlohmann::json& j, ContentType& t);

} // namespace fdk

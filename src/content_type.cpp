#include "fdk/content_type.hpp"
#include "fdk/error.hpp"
#include <optional>

namespace fdk {

namespace {

std::optional<ContentType> lookup(std::string_view s) {
    if (s == mime::JSON)                             return ContentType::JSON;
    if (s == mime::YAML_TEXT || s == mime::YAML_APP) return ContentType::YAML;
    if (s == mime::XML_TEXT || s == mime::XML_APP)   return ContentType::XML;
    if (s == mime::TEXT)                             return ContentType::Plain;
    if (s == mime::FORM)                             return ContentType::URLEncoded;
    return std::nullopt;
}

} // anonymous namespace

ContentType content_type_from_string(std::string_view s) noexcept {
    return lookup(s).value_or(ContentType::JSON);
}

ContentType content_type_from_string(std::string_view s, ContentTypePolicy policy) {
    auto t = lookup(s);
    if (t) return *t;
    if (policy == ContentTypePolicy::Reject) {
        throw CoercionError("unsupported content type: " + std::string(s));
    }
    return ContentType::JSON;
}

std::string content_type_to_header(ContentType t) {
    switch (t) {
        case ContentType::JSON:       return std::string(mime::JSON);
        case ContentType::YAML:       return std::string(mime::YAML_TEXT);
        case ContentType::XML:        return std::string(mime::XML_APP);
        case ContentType::Plain:      return std::string(mime::TEXT);
        case ContentType::URLEncoded: return std::string(mime::FORM);
    }
    return std::string(mime::JSON);
}

std::string_view content_type_name(ContentType t) noexcept {
    switch (t) {
        case ContentType::JSON:       return "JSON";
        case ContentType::YAML:       return "YAML";
        case ContentType::XML:        return "XML";
        case ContentType::Plain:      return "Plain";
        case ContentType::URLEncoded: return "URLEncoded";
    }
    return "JSON";
}

void to_json(nlohmann::json& j, ContentType t) {
    j = content_type_to_header(t);
}

void from_json(const nlohmann::json& j, ContentType& t) {
    t = content_type_from_string(j.get<std::string>());
}

} // namespace fdk

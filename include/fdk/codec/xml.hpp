#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace fdk {

/// Maps XML documents onto the JSON value model.
///
/// Decoding ignores the root element's name. Child elements and attributes
/// become members, a name that repeats becomes an array, and a leaf
/// element's text becomes a scalar typed by `shape`. Text mixed in with
/// child elements is kept under "$value".
///
/// Encoding writes one child element per member, one element per array
/// item, and skips null members.
class XmlCodec {
public:
    [[nodiscard]] static nlohmann::json parse(std::string_view text,
                                              const nlohmann::json& shape = nullptr);

    [[nodiscard]] static std::string serialize(const nlohmann::json& doc,
                                               const std::string& root_name);
};

} // namespace fdk

#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace fdk {

class JsonCodec {
public:
    /// Parse a complete JSON document (any root value, scalars included).
    /// Throws CoercionError carrying the parser's message on invalid input.
    [[nodiscard]] static nlohmann::json parse(std::string_view raw);

    /// Compact serialization. Throws CoercionError on strings that are
    /// not valid UTF-8.
    [[nodiscard]] static std::string serialize(const nlohmann::json& doc);
};

} // namespace fdk

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace fdk {

/// application/x-www-form-urlencoded, one level deep: an object whose
/// members are scalars or arrays of scalars (repeated keys).
class FormCodec {
public:
    [[nodiscard]] static nlohmann::json parse(const std::string& text,
                                              const nlohmann::json& shape = nullptr);

    /// Members are written in key order; null members are skipped.
    [[nodiscard]] static std::string serialize(const nlohmann::json& doc);

    /// Percent-decode one component, '+' meaning space. A '%' not followed
    /// by two hex digits is kept as is, and decoded bytes that do not form
    /// valid UTF-8 are replaced with U+FFFD.
    [[nodiscard]] static std::string decode_component(const std::string& s);

    /// Percent-encode one component: A-Z a-z 0-9 * - . _ are kept,
    /// space becomes '+', every other byte becomes %XX.
    [[nodiscard]] static std::string encode_component(const std::string& s);
};

} // namespace fdk

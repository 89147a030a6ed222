#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace fdk {

/// Plain text holds exactly one scalar: a string, a number or a boolean.
class PlainCodec {
public:
    /// Empty text for a null shape (an optional target) is null, otherwise
    /// the text is typed by `shape`. Structured shapes are rejected.
    [[nodiscard]] static nlohmann::json parse(const std::string& text,
                                              const nlohmann::json& shape = nullptr);

    [[nodiscard]] static std::string serialize(const nlohmann::json& doc);
};

} // namespace fdk

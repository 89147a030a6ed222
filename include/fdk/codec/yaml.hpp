#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace fdk {

class YamlCodec {
public:
    /// Parse the first YAML document in `raw`.
    ///
    /// Plain scalars are typed by `shape` where it has an opinion and by
    /// the YAML core schema otherwise (null, booleans, integers, floats).
    /// Quoted scalars are always strings.
    [[nodiscard]] static nlohmann::json parse(std::string_view raw,
                                              const nlohmann::json& shape = nullptr);

    /// Block-style YAML. Strings that would read back as another type
    /// are double-quoted.
    [[nodiscard]] static std::string serialize(const nlohmann::json& doc);
};

} // namespace fdk

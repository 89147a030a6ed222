#include "fdk/codec/yaml.hpp"
#include "fdk/codec/scalar.hpp"
#include "fdk/error.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <optional>

namespace fdk {

namespace {

bool is_null_literal(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> bool_literal(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

// .inf, -.inf and .nan in the core schema's three spellings
std::optional<double> special_float(const std::string& s) {
    std::string body = s;
    bool negative = false;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        negative = body[0] == '-';
        body.erase(0, 1);
    }
    if (body == ".inf" || body == ".Inf" || body == ".INF") {
        return negative ? -HUGE_VAL : HUGE_VAL;
    }
    if (s == ".nan" || s == ".NaN" || s == ".NAN") return std::nan("");
    return std::nullopt;
}

// YAML 1.2 core schema resolution of an untagged plain scalar.
nlohmann::json resolve_plain(const std::string& text) {
    if (is_null_literal(text)) return nullptr;
    if (auto b = bool_literal(text)) return *b;
    if (auto n = codec::number_from_text(text)) return *n;
    if (auto f = special_float(text)) return *f;
    return text;
}

bool is_string_tag(const std::string& tag) {
    return tag == "!" || tag == "tag:yaml.org,2002:str";
}

nlohmann::json node_to_json(const YAML::Node& node, const nlohmann::json& shape) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                auto key = kv.first.as<std::string>();
                obj[key] = node_to_json(kv.second, codec::field_shape(shape, key));
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(node_to_json(item, codec::element_shape(shape)));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            if (is_string_tag(node.Tag()) || shape.is_string()) return text;
            if (shape.is_boolean()) {
                auto b = bool_literal(text);
                if (!b) throw CoercionError("invalid type: expected a boolean, found `" + text + "`");
                return *b;
            }
            if (shape.is_number_float()) {
                if (auto f = special_float(text)) return *f;
            }
            if (shape.is_number()) return codec::scalar_from_text(text, shape);
            return resolve_plain(text);
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

void emit_string(YAML::Emitter& out, const std::string& s) {
    if (!resolve_plain(s).is_string()) out << YAML::DoubleQuoted;
    out << s;
}

void emit(YAML::Emitter& out, const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::object:
            out << YAML::BeginMap;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out << YAML::Key;
                emit_string(out, it.key());
                out << YAML::Value;
                emit(out, it.value());
            }
            out << YAML::EndMap;
            break;
        case nlohmann::json::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : v) emit(out, item);
            out << YAML::EndSeq;
            break;
        case nlohmann::json::value_t::string:
            emit_string(out, v.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::boolean:
            out << v.get<bool>();
            break;
        case nlohmann::json::value_t::number_float: {
            double d = v.get<double>();
            if (std::isnan(d)) out << ".nan";
            else if (std::isinf(d)) out << (d < 0 ? "-.inf" : ".inf");
            else out << v.dump();
            break;
        }
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            // nlohmann's shortest round-trip form, written as a plain scalar
            out << v.dump();
            break;
        case nlohmann::json::value_t::null:
            out << YAML::Null;
            break;
        default:
            throw CoercionError(std::string("unsupported value: ") + v.type_name());
    }
}

} // anonymous namespace

nlohmann::json YamlCodec::parse(std::string_view raw, const nlohmann::json& shape) {
    try {
        YAML::Node root = YAML::Load(std::string(raw));
        return node_to_json(root, shape);
    } catch (const YAML::Exception& e) {
        throw CoercionError(e.what());
    }
}

std::string YamlCodec::serialize(const nlohmann::json& doc) {
    YAML::Emitter out;
    emit(out, doc);
    if (!out.good()) {
        throw CoercionError(out.GetLastError());
    }
    std::string text(out.c_str(), out.size());
    text.push_back('\n');
    return text;
}

} // namespace fdk

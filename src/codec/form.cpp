#include "fdk/codec/form.hpp"
#include "fdk/codec/scalar.hpp"
#include "fdk/error.hpp"
#include "fdk/text.hpp"
#include <string_view>

namespace fdk {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '*' || c == '-' || c == '.' || c == '_';
}

void append_pair(std::string& out, const std::string& key, const nlohmann::json& value) {
    if (!out.empty()) out.push_back('&');
    out += FormCodec::encode_component(key);
    out.push_back('=');
    out += FormCodec::encode_component(codec::scalar_to_text(value));
}

nlohmann::json typed_member(const std::string& key, const nlohmann::json& raw,
                            const nlohmann::json& shape) {
    if (shape.is_array()) {
        nlohmann::json arr = nlohmann::json::array();
        const auto& item_shape = codec::element_shape(shape);
        if (raw.is_array()) {
            for (const auto& item : raw) {
                arr.push_back(codec::scalar_from_text(item.get<std::string>(), item_shape));
            }
        } else {
            arr.push_back(codec::scalar_from_text(raw.get<std::string>(), item_shape));
        }
        return arr;
    }
    if (raw.is_array()) {
        // Only an untyped target may collect repeated keys
        if (!shape.is_null()) throw CoercionError("duplicate field `" + key + "`");
        return raw;
    }
    return codec::scalar_from_text(raw.get<std::string>(), shape);
}

} // anonymous namespace

std::string FormCodec::decode_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0
                   && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>((hex_value(s[i + 1]) << 4) | hex_value(s[i + 2])));
            i += 2;
        } else {
            // A '%' without two hex digits after it is literal
            out.push_back(c);
        }
    }
    return utf8_lossy(out);
}

std::string FormCodec::encode_component(const std::string& s) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

nlohmann::json FormCodec::parse(const std::string& text, const nlohmann::json& shape) {
    if (!shape.is_null() && !shape.is_object() && !shape.is_discarded()) {
        throw CoercionError(std::string("unsupported type: form data cannot be decoded into ")
                            + shape.type_name());
    }

    // Collect raw string values first; repeated keys become arrays.
    nlohmann::json raw = nlohmann::json::object();
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t amp = text.find('&', pos);
        if (amp == std::string::npos) amp = text.size();
        std::string_view pair(text.data() + pos, amp - pos);
        pos = amp + 1;
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        std::string key = decode_component(std::string(pair.substr(0, eq)));
        std::string value = eq == std::string_view::npos
            ? std::string()
            : decode_component(std::string(pair.substr(eq + 1)));

        auto it = raw.find(key);
        if (it == raw.end()) {
            raw[key] = std::move(value);
        } else if (it->is_array()) {
            it->push_back(std::move(value));
        } else {
            nlohmann::json first = std::move(*it);
            *it = nlohmann::json::array({std::move(first), std::move(value)});
        }
    }

    nlohmann::json obj = nlohmann::json::object();
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        obj[it.key()] = typed_member(it.key(), it.value(), codec::field_shape(shape, it.key()));
    }
    codec::fill_from_shape(obj, shape);
    return obj;
}

std::string FormCodec::serialize(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw CoercionError("top-level serializer supports only maps and structs");
    }
    std::string out;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const auto& value = it.value();
        if (value.is_null()) continue;
        if (value.is_array()) {
            for (const auto& item : value) {
                if (!codec::is_scalar(item)) {
                    throw CoercionError("unsupported value: nested sequence in field `" + it.key() + "`");
                }
                if (item.is_null()) continue;
                append_pair(out, it.key(), item);
            }
            continue;
        }
        if (!codec::is_scalar(value)) {
            throw CoercionError("unsupported value: nested structure in field `" + it.key() + "`");
        }
        append_pair(out, it.key(), value);
    }
    return out;
}

} // namespace fdk

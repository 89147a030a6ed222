#include "fdk/codec/scalar.hpp"
#include "fdk/error.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace fdk {
namespace codec {

namespace {

template <typename Int>
std::errc to_integer(const std::string& text, Int& value) {
    std::string_view sv = text;
    // from_chars does not accept an explicit plus sign
    if (sv.size() > 1 && sv.front() == '+') sv.remove_prefix(1);
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc() && ptr != sv.data() + sv.size()) return std::errc::invalid_argument;
    return ec;
}

std::errc to_float(const std::string& text, double& value) {
    if (text.find_first_of("0123456789") == std::string::npos
        || text.find_first_not_of("0123456789+-.eE") != std::string::npos) {
        return std::errc::invalid_argument;
    }
    errno = 0;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::errc::invalid_argument;
    if (errno == ERANGE) return std::errc::result_out_of_range;
    return std::errc();
}

template <typename Int>
Int parse_integer(const std::string& text) {
    if (text.empty()) {
        throw CoercionError("cannot parse integer from empty string");
    }
    Int value{};
    auto ec = to_integer(text, value);
    if (ec == std::errc::result_out_of_range) {
        throw CoercionError("number too large to fit in target type: " + text);
    }
    if (ec != std::errc()) {
        throw CoercionError("invalid digit found in string: " + text);
    }
    return value;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

// "inf", "infinity" and "nan" in any case, with an optional sign
std::optional<double> non_finite(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (iequals(text, "inf") || iequals(text, "infinity")) {
        return negative ? -HUGE_VAL : HUGE_VAL;
    }
    if (iequals(text, "nan")) {
        return negative ? -std::nan("") : std::nan("");
    }
    return std::nullopt;
}

double parse_float(const std::string& text) {
    if (text.empty()) {
        throw CoercionError("cannot parse float from empty string");
    }
    if (auto special = non_finite(text)) return *special;
    double value = 0.0;
    auto ec = to_float(text, value);
    if (ec == std::errc::result_out_of_range) {
        throw CoercionError("float literal out of range: " + text);
    }
    if (ec != std::errc()) {
        throw CoercionError("invalid float literal: " + text);
    }
    return value;
}

bool parse_bool(const std::string& text) {
    if (text == "true") return true;
    if (text == "false") return false;
    throw CoercionError("provided string was not `true` or `false`: " + text);
}

bool same_integer(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number_unsigned() && b.is_number_unsigned()) {
        return a.get<uint64_t>() == b.get<uint64_t>();
    }
    if (a.is_number_unsigned() || b.is_number_unsigned()) {
        const auto& s = a.is_number_unsigned() ? b : a;
        const auto& u = a.is_number_unsigned() ? a : b;
        int64_t sv = s.get<int64_t>();
        return sv >= 0 && static_cast<uint64_t>(sv) == u.get<uint64_t>();
    }
    return a.get<int64_t>() == b.get<int64_t>();
}

const nlohmann::json& null_shape() {
    static const nlohmann::json null_value;
    return null_value;
}

} // anonymous namespace

nlohmann::json scalar_from_text(const std::string& text, const nlohmann::json& shape) {
    switch (shape.type()) {
        case nlohmann::json::value_t::boolean:
            return parse_bool(text);
        case nlohmann::json::value_t::number_integer:
            return parse_integer<int64_t>(text);
        case nlohmann::json::value_t::number_unsigned:
            return parse_integer<uint64_t>(text);
        case nlohmann::json::value_t::number_float:
            return parse_float(text);
        default:
            return text;
    }
}

const nlohmann::json& field_shape(const nlohmann::json& shape, const std::string& key) {
    if (shape.is_object()) {
        auto it = shape.find(key);
        if (it != shape.end()) return *it;
    }
    return null_shape();
}

const nlohmann::json& element_shape(const nlohmann::json& shape) {
    if (shape.is_array() && !shape.empty()) return shape.front();
    return null_shape();
}

void fill_from_shape(nlohmann::json& obj, const nlohmann::json& shape) {
    if (!obj.is_object() || !shape.is_object()) return;
    for (auto it = shape.begin(); it != shape.end(); ++it) {
        auto member = obj.find(it.key());
        if (member == obj.end()) {
            if (it->is_array()) obj[it.key()] = nlohmann::json::array();
            else if (it->is_null()) obj[it.key()] = nullptr;
        } else if (it->is_array() && !member->is_array()) {
            nlohmann::json single = std::move(*member);
            *member = nlohmann::json::array({std::move(single)});
        }
    }
}

std::string scalar_to_text(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::null:
            return {};
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case nlohmann::json::value_t::number_float: {
            // dump() writes non-finite values as null
            double d = value.get<double>();
            if (std::isnan(d)) return "NaN";
            if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
            return value.dump();
        }
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            return value.dump();
        default:
            throw CoercionError(std::string("unsupported value: expected a scalar, got ") + value.type_name());
    }
}

std::optional<nlohmann::json> number_from_text(const std::string& text) {
    int64_t i = 0;
    if (to_integer(text, i) == std::errc()) return nlohmann::json(i);
    uint64_t u = 0;
    if (to_integer(text, u) == std::errc()) return nlohmann::json(u);
    double d = 0.0;
    if (to_float(text, d) == std::errc()) return nlohmann::json(d);
    return std::nullopt;
}

void infer_untyped_scalars(nlohmann::json& doc, const nlohmann::json& shape) {
    if (doc.is_object()) {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            infer_untyped_scalars(it.value(), field_shape(shape, it.key()));
        }
    } else if (doc.is_array()) {
        const auto& item_shape = element_shape(shape);
        for (auto& item : doc) infer_untyped_scalars(item, item_shape);
    } else if (doc.is_string() && (shape.is_null() || shape.is_discarded())) {
        const auto& text = doc.get_ref<const std::string&>();
        if (text == "true") doc = true;
        else if (text == "false") doc = false;
        else if (auto n = number_from_text(text)) doc = *n;
    }
}

bool is_scalar(const nlohmann::json& value) {
    return value.is_primitive() && !value.is_binary();
}

void verify_converted_scalars(const nlohmann::json& decoded, const nlohmann::json& converted) {
    if (decoded.is_object() && converted.is_object()) {
        for (auto it = decoded.begin(); it != decoded.end(); ++it) {
            auto member = converted.find(it.key());
            if (member != converted.end()) verify_converted_scalars(it.value(), *member);
        }
        return;
    }
    if (decoded.is_array() && converted.is_array()) {
        size_t n = std::min(decoded.size(), converted.size());
        for (size_t i = 0; i < n; ++i) verify_converted_scalars(decoded[i], converted[i]);
        return;
    }

    if (decoded.is_boolean()) {
        if (converted.is_number()) {
            throw CoercionError("invalid type: boolean `" + decoded.dump() + "`, expected a number");
        }
        return;
    }
    // Integers and floats both widen into floating point targets
    if (!decoded.is_number() || !converted.is_number() || converted.is_number_float()) return;

    if (decoded.is_number_float()) {
        throw CoercionError("invalid type: floating point `" + decoded.dump() + "`, expected an integer");
    }
    if (!same_integer(decoded, converted)) {
        throw CoercionError("invalid value: integer `" + decoded.dump()
                            + "`, out of range for the target type");
    }
}

} // namespace codec
} // namespace fdk

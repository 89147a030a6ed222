#pragma once
#include "content_type.hpp"
#include "error.hpp"
#include "text.hpp"
#include "codec/json.hpp"
#include "codec/yaml.hpp"
#include "codec/xml.hpp"
#include "codec/plain.hpp"
#include "codec/form.hpp"
#include "codec/scalar.hpp"
#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>

namespace fdk {

struct CoercionOptions {
    /// Name of the root element written by the XML path.
    std::string xml_root = "root";
};

/// T can be produced from a payload: nlohmann::json converts to it,
/// through a from_json overload or a built-in conversion.
template <typename T, typename = void>
struct is_input_coercible : std::false_type {};

template <typename T>
struct is_input_coercible<T, std::void_t<decltype(std::declval<const nlohmann::json&>().template get<T>())>>
    : std::true_type {};

/// T can be written as a payload: nlohmann::json is constructible from it.
template <typename T>
struct is_output_coercible : std::is_constructible<nlohmann::json, const T&> {};

template <typename T>
inline constexpr bool is_input_coercible_v = is_input_coercible<T>::value;

template <typename T>
inline constexpr bool is_output_coercible_v = is_output_coercible<T>::value;

/// A payload ready for the response: bytes plus their Content-Type.
struct EncodedPayload {
    Bytes body;
    std::string content_type;
};

namespace detail {

/// JSON form of a default-constructed T, or discarded when T cannot be
/// default constructed or written out.
template <typename T>
nlohmann::json shape_of() {
    if constexpr (std::is_default_constructible_v<T> && is_output_coercible_v<T>) {
        try {
            return nlohmann::json(T{});
        } catch (const nlohmann::json::exception&) {
            return nlohmann::json(nlohmann::json::value_t::discarded);
        }
    } else {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
}

/// get<T>() with the numbers checked against what T actually holds.
/// Types that cannot be written back to JSON are converted unchecked.
template <typename T>
T convert(const nlohmann::json& doc) {
    T value = doc.template get<T>();
    if constexpr (is_output_coercible_v<T>) {
        codec::verify_converted_scalars(doc, nlohmann::json(value));
    }
    return value;
}

/// Convert a decoded document into T. Documents from untyped text formats
/// get one more attempt with numbers and booleans inferred where the
/// shape had no opinion; the first failure's message is the one reported.
template <typename T>
T to_value(nlohmann::json doc, const nlohmann::json& shape, bool untyped) {
    try {
        return convert<T>(doc);
    } catch (const std::exception& first) {
        std::string message = first.what();
        if (untyped) {
            codec::infer_untyped_scalars(doc, shape);
            try {
                return convert<T>(doc);
            } catch (const std::exception&) {
                throw CoercionError(message);
            }
        }
        throw CoercionError(message);
    }
}

template <typename T>
nlohmann::json to_document(T value) {
    try {
        return nlohmann::json(std::move(value));
    } catch (const std::exception& e) {
        throw CoercionError(e.what());
    }
}

} // namespace detail

// ---- Decode paths ----

template <typename T>
T try_decode_json(Bytes input) {
    auto doc = JsonCodec::parse(bytes_view(input));
    return detail::to_value<T>(std::move(doc), nlohmann::json(), false);
}

template <typename T>
T try_decode_yaml(Bytes input) {
    auto shape = detail::shape_of<T>();
    auto doc = YamlCodec::parse(bytes_view(input), shape);
    return detail::to_value<T>(std::move(doc), shape, false);
}

template <typename T>
T try_decode_xml(Bytes input) {
    auto shape = detail::shape_of<T>();
    auto doc = XmlCodec::parse(bytes_to_text(input), shape);
    return detail::to_value<T>(std::move(doc), shape, true);
}

template <typename T>
T try_decode_plain(Bytes input) {
    auto shape = detail::shape_of<T>();
    auto doc = PlainCodec::parse(bytes_to_text(input), shape);
    return detail::to_value<T>(std::move(doc), shape, true);
}

template <typename T>
T try_decode_urlencoded(Bytes input) {
    auto shape = detail::shape_of<T>();
    auto doc = FormCodec::parse(bytes_to_text(input), shape);
    return detail::to_value<T>(std::move(doc), shape, true);
}

// ---- Encode paths ----

template <typename T>
Bytes try_encode_json(T value) {
    return to_bytes(JsonCodec::serialize(detail::to_document(std::move(value))));
}

template <typename T>
Bytes try_encode_yaml(T value) {
    return to_bytes(YamlCodec::serialize(detail::to_document(std::move(value))));
}

template <typename T>
Bytes try_encode_xml(T value, const CoercionOptions& options = {}) {
    return text_to_bytes(XmlCodec::serialize(detail::to_document(std::move(value)), options.xml_root));
}

template <typename T>
Bytes try_encode_plain(T value) {
    return text_to_bytes(PlainCodec::serialize(detail::to_document(std::move(value))));
}

template <typename T>
Bytes try_encode_urlencoded(T value) {
    return text_to_bytes(FormCodec::serialize(detail::to_document(std::move(value))));
}

// ---- Dispatch ----

/// Decode `input` as `type` into a T.
/// Throws CoercionError with the codec's message on failure.
template <typename T>
T decode(ContentType type, Bytes input) {
    static_assert(is_input_coercible_v<T>, "T must be convertible from nlohmann::json");
    switch (type) {
        case ContentType::JSON:       return try_decode_json<T>(std::move(input));
        case ContentType::YAML:       return try_decode_yaml<T>(std::move(input));
        case ContentType::XML:        return try_decode_xml<T>(std::move(input));
        case ContentType::Plain:      return try_decode_plain<T>(std::move(input));
        case ContentType::URLEncoded: return try_decode_urlencoded<T>(std::move(input));
    }
    return try_decode_json<T>(std::move(input));
}

/// Encode `value` as `type`.
/// Throws CoercionError with the codec's message on failure.
template <typename T>
Bytes encode(ContentType type, T value, const CoercionOptions& options = {}) {
    static_assert(is_output_coercible_v<T>, "T must be convertible to nlohmann::json");
    switch (type) {
        case ContentType::JSON:       return try_encode_json(std::move(value));
        case ContentType::YAML:       return try_encode_yaml(std::move(value));
        case ContentType::XML:        return try_encode_xml(std::move(value), options);
        case ContentType::Plain:      return try_encode_plain(std::move(value));
        case ContentType::URLEncoded: return try_encode_urlencoded(std::move(value));
    }
    return try_encode_json(std::move(value));
}

/// Classify the declared Content-Type and decode.
template <typename T>
T decode_payload(std::string_view declared_content_type, Bytes input,
                 ContentTypePolicy policy = ContentTypePolicy::FallbackToJson) {
    return decode<T>(content_type_from_string(declared_content_type, policy), std::move(input));
}

/// Encode and pair the bytes with the canonical Content-Type for `type`.
template <typename T>
EncodedPayload encode_payload(ContentType type, T value, const CoercionOptions& options = {}) {
    EncodedPayload out;
    out.body = encode(type, std::move(value), options);
    out.content_type = content_type_to_header(type);
    return out;
}

} // namespace fdk

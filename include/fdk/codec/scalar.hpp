#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace fdk {
namespace codec {

/// Shape is the JSON form of a default-constructed target value. Text
/// formats carry no scalar types, so the shape tells the decoder whether
/// "42" is meant as a string, an integer or a float.
///
/// Conversion rules for scalar_from_text:
///   shape string / null / object / array / discarded -> the text itself
///   boolean         -> "true" or "false", otherwise CoercionError
///   integer         -> signed 64-bit integer
///   unsigned        -> unsigned 64-bit integer
///   float           -> double; "inf", "infinity" and "nan" are accepted
///                      in any case and with an optional sign
[[nodiscard]] nlohmann::json scalar_from_text(const std::string& text, const nlohmann::json& shape);

/// Shape of member `key`, or a null shape when unknown.
[[nodiscard]] const nlohmann::json& field_shape(const nlohmann::json& shape, const std::string& key);

/// Shape of an array element, taken from the first element if any.
[[nodiscard]] const nlohmann::json& element_shape(const nlohmann::json& shape);

/// Reconcile a decoded object with its shape: members the shape declares
/// as arrays are wrapped when they occurred once, and absent array or
/// null-shaped members are added as [] and null.
void fill_from_shape(nlohmann::json& obj, const nlohmann::json& shape);

/// Render a JSON scalar as text. Strings are returned verbatim, null is
/// empty. Throws CoercionError for objects and arrays.
[[nodiscard]] std::string scalar_to_text(const nlohmann::json& value);

/// The number `text` spells, if any: signed integer, then unsigned, then
/// float. Never throws.
[[nodiscard]] std::optional<nlohmann::json> number_from_text(const std::string& text);

/// Second-chance typing for values decoded from untyped text: every string
/// whose shape is unknown (null) and that spells a boolean or a number is
/// replaced by that boolean or number.
void infer_untyped_scalars(nlohmann::json& doc, const nlohmann::json& shape);

[[nodiscard]] bool is_scalar(const nlohmann::json& value);

/// Compare the numbers and booleans of a decoded document with the same
/// leaves of `converted`, the target value written back to JSON.
/// nlohmann's arithmetic conversions are plain casts, so this is where an
/// out-of-range integer, a negative number in an unsigned field, a float
/// in an integer field or a boolean/number mix-up is caught.
/// Throws CoercionError on the first mismatch. Leaves missing from
/// `converted`, and floating point targets, are not checked.
void verify_converted_scalars(const nlohmann::json& decoded, const nlohmann::json& converted);

} // namespace codec
} // namespace fdk

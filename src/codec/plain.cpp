#include "fdk/codec/plain.hpp"
#include "fdk/codec/scalar.hpp"
#include "fdk/error.hpp"

namespace fdk {

nlohmann::json PlainCodec::parse(const std::string& text, const nlohmann::json& shape) {
    if (shape.is_structured()) {
        throw CoercionError(std::string("unsupported type: plain text cannot hold ") + shape.type_name());
    }
    if (shape.is_null() && text.empty()) return nullptr;
    return codec::scalar_from_text(text, shape);
}

std::string PlainCodec::serialize(const nlohmann::json& doc) {
    if (doc.is_structured()) {
        throw CoercionError(std::string("unsupported type: plain text cannot hold ") + doc.type_name());
    }
    return codec::scalar_to_text(doc);
}

} // namespace fdk

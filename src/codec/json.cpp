#include "fdk/codec/json.hpp"
#include "fdk/error.hpp"
#include <simdjson.h>
#include <string>

namespace fdk {

namespace {

nlohmann::json number_to_nlohmann(simdjson::ondemand::number num) {
    if (num.is_int64()) return nlohmann::json(num.get_int64());
    if (num.is_uint64()) return nlohmann::json(num.get_uint64());
    return nlohmann::json(num.get_double());
}

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_nlohmann(val.get_number());
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
    }
}

// Scalar roots cannot be fetched with get_value(), so they are read
// straight off the document.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array:
            return simdjson_to_nlohmann(doc.get_value());
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_nlohmann(doc.get_number());
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(doc.get_bool()));
        case simdjson::ondemand::json_type::null:
            if (!bool(doc.is_null())) throw simdjson::simdjson_error(simdjson::N_ATOM_ERROR);
            return nlohmann::json(nullptr);
        default:
            throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
    }
}

} // anonymous namespace

nlohmann::json JsonCodec::parse(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw CoercionError(simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw CoercionError(e.what());
    }

    if (!doc.at_end()) {
        throw CoercionError("trailing characters after JSON document");
    }
    return j;
}

std::string JsonCodec::serialize(const nlohmann::json& doc) {
    try {
        return doc.dump();
    } catch (const nlohmann::json::exception& e) {
        throw CoercionError(e.what());
    }
}

} // namespace fdk

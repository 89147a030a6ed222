#include "fdk/codec/xml.hpp"
#include "fdk/codec/scalar.hpp"
#include "fdk/error.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <climits>
#include <memory>
#include <set>

namespace fdk {

namespace {

constexpr const char* TEXT_KEY = "$value";

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
    void operator()(xmlChar* s) const { xmlFree(s); }
};
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

void ensure_parser_initialized() {
    static const bool initialized = [] {
        xmlInitParser();
        return true;
    }();
    (void)initialized;
}

std::string last_error_message(const char* fallback) {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) return fallback;
    std::string msg(err->message);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
    return msg;
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

const char* as_chars(const xmlChar* s) {
    return reinterpret_cast<const char*>(s);
}

const xmlChar* as_xml(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

// Adds `value` under `key`, turning repeated keys into arrays.
void add_member(nlohmann::json& obj, std::set<std::string>& repeated,
                const std::string& key, nlohmann::json value) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        obj[key] = std::move(value);
        return;
    }
    if (repeated.insert(key).second) {
        nlohmann::json first = std::move(*it);
        *it = nlohmann::json::array({std::move(first)});
    }
    it->push_back(std::move(value));
}

nlohmann::json element_to_json(const xmlNode* node, const nlohmann::json& shape) {
    nlohmann::json obj = nlohmann::json::object();
    std::set<std::string> repeated;
    bool has_members = false;
    std::string text;

    for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
        has_members = true;
        std::string name = as_chars(attr->name);
        XmlCharPtr raw(xmlNodeListGetString(node->doc, attr->children, 1));
        std::string value = raw ? as_chars(raw.get()) : "";
        add_member(obj, repeated, name, codec::scalar_from_text(value, codec::field_shape(shape, name)));
    }

    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            has_members = true;
            std::string name = as_chars(child->name);
            const auto& member_shape = codec::field_shape(shape, name);
            const auto& child_shape = member_shape.is_array() ? codec::element_shape(member_shape)
                                                              : member_shape;
            add_member(obj, repeated, name, element_to_json(child, child_shape));
        } else if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            if (child->content) text += as_chars(child->content);
        }
    }

    if (!has_members && !shape.is_object()) {
        return codec::scalar_from_text(text, shape);
    }

    if (!is_blank(text)) {
        obj[TEXT_KEY] = codec::scalar_from_text(text, codec::field_shape(shape, TEXT_KEY));
    }

    codec::fill_from_shape(obj, shape);
    return obj;
}

void check_name(const std::string& name) {
    if (xmlValidateName(as_xml(name), 0) != 0) {
        throw CoercionError("invalid XML element name: `" + name + "`");
    }
}

void fill_element(xmlNode* node, const nlohmann::json& value);

void append_member(xmlNode* parent, const std::string& name, const nlohmann::json& value) {
    if (value.is_null()) return;
    if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_array()) {
                throw CoercionError("unsupported value: nested sequence in element `" + name + "`");
            }
            append_member(parent, name, item);
        }
        return;
    }
    xmlNode* child = xmlNewChild(parent, nullptr, as_xml(name), nullptr);
    if (!child) throw CoercionError("failed to create XML element `" + name + "`");
    fill_element(child, value);
}

void fill_element(xmlNode* node, const nlohmann::json& value) {
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it.key() == TEXT_KEY) {
                xmlNodeAddContent(node, as_xml(codec::scalar_to_text(it.value())));
                continue;
            }
            check_name(it.key());
            append_member(node, it.key(), it.value());
        }
        return;
    }
    xmlNodeAddContent(node, as_xml(codec::scalar_to_text(value)));
}

} // anonymous namespace

nlohmann::json XmlCodec::parse(std::string_view text, const nlohmann::json& shape) {
    ensure_parser_initialized();
    if (text.size() > static_cast<size_t>(INT_MAX)) {
        throw CoercionError("XML document too large");
    }

    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(text.data(), static_cast<int>(text.size()), nullptr, "UTF-8",
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        throw CoercionError(last_error_message("failed to parse XML document"));
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        throw CoercionError("XML document has no root element");
    }
    return element_to_json(root, shape);
}

std::string XmlCodec::serialize(const nlohmann::json& doc, const std::string& root_name) {
    ensure_parser_initialized();
    if (doc.is_array()) {
        throw CoercionError("unsupported value: a sequence cannot be an XML document root");
    }
    check_name(root_name);

    XmlDocPtr xml(xmlNewDoc(BAD_CAST "1.0"));
    if (!xml) throw CoercionError("failed to allocate XML document");
    xmlNode* root = xmlNewNode(nullptr, as_xml(root_name));
    if (!root) throw CoercionError("failed to create XML root element");
    xmlDocSetRootElement(xml.get(), root);

    if (!doc.is_null()) fill_element(root, doc);

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(xml.get(), &buffer, &size, "UTF-8");
    XmlCharPtr owned(buffer);
    if (!owned || size < 0) {
        throw CoercionError(last_error_message("failed to serialize XML document"));
    }
    return std::string(as_chars(owned.get()), static_cast<size_t>(size));
}

} // namespace fdk

/**
 * @file XmlFormat.cpp
 * @brief XML collaborator (libxml2)
 */

#include "graft/Errors.hpp"
#include "graft/Format.hpp"
#include "graft/Parse.hpp"
#include "graft/Util.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <memory>
#include <set>

namespace graft {

namespace {

struct DocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

struct XmlCharDeleter {
    void operator()(xmlChar* text) const { xmlFree(text); }
};
using XmlText = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string to_std(const xmlChar* text) {
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

Node typed_text(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) {
        return Node();
    }
    return Node(parse_scalar(text));
}

// Repeated element names collapse into a list. `repeated` tracks which
// keys were turned into lists here, so a genuine list value is never
// extended by accident.
void add_child(Map& map, std::set<std::string>& repeated, const std::string& key, Node value) {
    Node* existing = map.find(key);
    if (!existing) {
        map.insert_or_assign(key, std::move(value));
        return;
    }
    if (repeated.count(key) == 0) {
        Node first = std::move(*existing);
        *existing = Node::list({std::move(first)});
        repeated.insert(key);
    }
    existing->as_list().push_back(std::move(value));
}

Node element_to_node(xmlDoc* doc, xmlNode* element) {
    Map map;
    std::set<std::string> repeated;
    std::string text;
    bool has_elements = false;

    for (xmlAttr* attr = element->properties; attr; attr = attr->next) {
        XmlText value(xmlNodeListGetString(doc, attr->children, 1));
        map.insert_or_assign("@" + to_std(attr->name), typed_text(to_std(value.get())));
    }

    for (xmlNode* child = element->children; child; child = child->next) {
        switch (child->type) {
            case XML_ELEMENT_NODE:
                has_elements = true;
                add_child(map, repeated, to_std(child->name), element_to_node(doc, child));
                break;
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                text += to_std(child->content);
                break;
            default:
                break;  // comments, processing instructions
        }
    }

    if (!has_elements && map.empty()) {
        return typed_text(text);
    }
    if (!trim(text).empty()) {
        map.insert_or_assign("#text", typed_text(text));
    }
    return Node(std::move(map));
}

std::string scalar_text(const Scalar& s) {
    return s.is_float() ? float_text(s.as_float()) : s.to_string();
}

void check_name(const std::string& name) {
    if (name.empty() || xmlValidateName(reinterpret_cast<const xmlChar*>(name.c_str()), 0) != 0) {
        throw GraftError("Cannot write '" + name + "' as an XML name");
    }
}

void add_content(xmlNode* parent, const Node& node);

void add_element(xmlNode* parent, const std::string& name, const Node& value) {
    check_name(name);
    xmlNode* child = xmlNewChild(parent, nullptr, BAD_CAST name.c_str(), nullptr);
    add_content(child, value);
}

void add_content(xmlNode* parent, const Node& node) {
    switch (node.kind()) {
        case NodeKind::Scalar:
            if (!node.is_null()) {
                xmlNodeAddContent(parent, BAD_CAST scalar_text(node.scalar()).c_str());
            }
            break;
        case NodeKind::List:
            for (const auto& item : node.as_list()) {
                add_element(parent, "item", item);
            }
            break;
        case NodeKind::Map: {
            const Map& map = node.as_map();
            for (std::size_t i = 0; i < map.size(); ++i) {
                const std::string& key = map.key_at(i);
                const Node& value = map.value_at(i);
                if (key == "#text" && value.is_scalar()) {
                    add_content(parent, value);
                } else if (starts_with(key, "@") && value.is_scalar()) {
                    const std::string attr = key.substr(1);
                    check_name(attr);
                    const std::string text = value.is_null() ? "" : scalar_text(value.scalar());
                    xmlSetProp(parent, BAD_CAST attr.c_str(), BAD_CAST text.c_str());
                } else if (value.is_list()) {
                    for (const auto& item : value.as_list()) {
                        add_element(parent, key, item);
                    }
                } else {
                    add_element(parent, key, value);
                }
            }
            break;
        }
    }
}

} // anonymous namespace

Node XmlFormat::parse(const std::string& text) const {
    DocPtr doc(xmlReadMemory(text.data(), static_cast<int>(text.size()), "input.xml", nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        std::string details = err && err->message ? trim(err->message) : "malformed document";
        if (err) {
            details = "line " + std::to_string(err->line) + ": " + details;
        }
        throw FormatParseError("xml", details);
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        throw FormatParseError("xml", "no document element");
    }
    Node tree = element_to_node(doc.get(), root);
    // An empty document element is an empty tree, not a null one.
    if (tree.is_null()) {
        return Node::map();
    }
    return tree;
}

std::string XmlFormat::serialize(const Node& root) const {
    check_name(root_name_);
    DocPtr doc(xmlNewDoc(BAD_CAST "1.0"));
    xmlNode* element = xmlNewNode(nullptr, BAD_CAST root_name_.c_str());
    xmlDocSetRootElement(doc.get(), element);
    add_content(element, root);

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc.get(), &buffer, &size, "UTF-8", 1);
    XmlText owned(buffer);
    if (!owned) {
        throw GraftError("Failed to write xml");
    }
    return std::string(reinterpret_cast<const char*>(owned.get()), static_cast<std::size_t>(size));
}

} // namespace graft

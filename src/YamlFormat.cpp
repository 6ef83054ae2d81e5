/**
 * @file YamlFormat.cpp
 * @brief YAML collaborator (yaml-cpp)
 *
 * Plain scalars are typed with parse_scalar() ("~" and "" are null);
 * quoted scalars always stay strings. Output uses block style, with
 * strings quoted whenever a plain rendering would read back as
 * another type.
 */

#include "graft/Errors.hpp"
#include "graft/Format.hpp"
#include "graft/Parse.hpp"

#include <yaml-cpp/yaml.h>

namespace graft {

namespace {

Node from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Node();
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            // Quoted scalars carry the non-specific tag "!"
            if (node.Tag() == "!") {
                return Node(text);
            }
            if (text.empty() || text == "~") {
                return Node();
            }
            return Node(parse_scalar(text));
        }
        case YAML::NodeType::Sequence: {
            List items;
            items.reserve(node.size());
            for (const auto& item : node) {
                items.push_back(from_yaml(item));
            }
            return Node(std::move(items));
        }
        case YAML::NodeType::Map: {
            Map map;
            for (const auto& entry : node) {
                map.insert_or_assign(entry.first.as<std::string>(), from_yaml(entry.second));
            }
            return Node(std::move(map));
        }
    }
    return Node();
}

void emit_scalar(YAML::Emitter& out, const Scalar& s) {
    switch (s.kind()) {
        case ScalarKind::Null:
            out << YAML::Null;
            break;
        case ScalarKind::Boolean:
            out << (s.as_boolean() ? "true" : "false");
            break;
        case ScalarKind::Integer:
            out << s.to_string();
            break;
        case ScalarKind::Float:
            out << float_text(s.as_float());
            break;
        case ScalarKind::String: {
            const std::string& text = s.as_string();
            if (text.empty() || text == "~" || !parse_scalar(text).is_string()) {
                out << YAML::DoubleQuoted << text;
            } else {
                out << text;
            }
            break;
        }
    }
}

void emit(YAML::Emitter& out, const Node& node) {
    switch (node.kind()) {
        case NodeKind::Scalar:
            emit_scalar(out, node.scalar());
            break;
        case NodeKind::List: {
            const auto& items = node.as_list();
            if (items.empty()) {
                out << YAML::Flow;
            }
            out << YAML::BeginSeq;
            for (const auto& item : items) {
                emit(out, item);
            }
            out << YAML::EndSeq;
            break;
        }
        case NodeKind::Map: {
            const Map& map = node.as_map();
            if (map.empty()) {
                out << YAML::Flow;
            }
            out << YAML::BeginMap;
            for (std::size_t i = 0; i < map.size(); ++i) {
                out << YAML::Key << map.key_at(i) << YAML::Value;
                emit(out, map.value_at(i));
            }
            out << YAML::EndMap;
            break;
        }
    }
}

} // anonymous namespace

Node YamlFormat::parse(const std::string& text) const {
    try {
        return from_yaml(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw FormatParseError("yaml", e.what());
    }
}

std::string YamlFormat::serialize(const Node& root) const {
    YAML::Emitter out;
    out.SetIndent(static_cast<std::size_t>(indent_));
    emit(out, root);
    if (!out.good()) {
        throw GraftError("Failed to write yaml: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

} // namespace graft

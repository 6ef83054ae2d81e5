/**
 * @file JsonFormat.cpp
 * @brief JSON collaborator (nlohmann::json)
 */

#include "graft/Errors.hpp"
#include "graft/Format.hpp"
#include "graft/Json.hpp"

#include <cstdint>
#include <limits>

namespace graft {

Node node_from_json(const nlohmann::ordered_json& j) {
    using value_t = nlohmann::ordered_json::value_t;
    switch (j.type()) {
        case value_t::null:
        case value_t::discarded:
            return Node();
        case value_t::boolean:
            return Node(j.get<bool>());
        case value_t::number_integer:
            return Node(j.get<std::int64_t>());
        case value_t::number_unsigned: {
            const auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Node(static_cast<std::int64_t>(u));
            }
            return Node(static_cast<double>(u));
        }
        case value_t::number_float:
            return Node(j.get<double>());
        case value_t::string:
            return Node(j.get<std::string>());
        case value_t::array: {
            List items;
            items.reserve(j.size());
            for (const auto& elem : j) {
                items.push_back(node_from_json(elem));
            }
            return Node(std::move(items));
        }
        case value_t::object: {
            Map map;
            for (auto it = j.begin(); it != j.end(); ++it) {
                map.insert_or_assign(it.key(), node_from_json(it.value()));
            }
            return Node(std::move(map));
        }
        case value_t::binary:
            break;
    }
    throw FormatParseError("json", "unsupported JSON value type");
}

nlohmann::ordered_json node_to_json(const Node& node) {
    switch (node.kind()) {
        case NodeKind::Scalar: {
            const Scalar& s = node.scalar();
            switch (s.kind()) {
                case ScalarKind::Null: return nullptr;
                case ScalarKind::Boolean: return s.as_boolean();
                case ScalarKind::Integer: return s.as_integer();
                case ScalarKind::Float: return s.as_float();
                case ScalarKind::String: return s.as_string();
            }
            break;
        }
        case NodeKind::List: {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& item : node.as_list()) {
                arr.push_back(node_to_json(item));
            }
            return arr;
        }
        case NodeKind::Map: {
            auto obj = nlohmann::ordered_json::object();
            const Map& map = node.as_map();
            for (std::size_t i = 0; i < map.size(); ++i) {
                obj[map.key_at(i)] = node_to_json(map.value_at(i));
            }
            return obj;
        }
    }
    return nullptr;
}

Node JsonFormat::parse(const std::string& text) const {
    try {
        return node_from_json(nlohmann::ordered_json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatParseError("json", e.what());
    }
}

std::string JsonFormat::serialize(const Node& root) const {
    return node_to_json(root).dump(indent_);
}

} // namespace graft

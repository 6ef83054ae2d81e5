/**
 * @file TomlFormat.cpp
 * @brief TOML collaborator (toml++)
 *
 * Dates and times become strings. TOML has no null, so null scalars
 * are written as empty strings; a root that is not a map is written
 * under the key "value".
 */

#include "graft/Errors.hpp"
#include "graft/Format.hpp"

#include <toml++/toml.hpp>

#include <sstream>

namespace graft {

namespace {

template <typename T>
Node streamed(const T& value) {
    std::ostringstream ss;
    ss << value;
    return Node(ss.str());
}

Node from_toml(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Node(node.as_string()->get());

        case toml::node_type::integer:
            return Node(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Node(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Node(node.as_boolean()->get());

        case toml::node_type::date:
            return streamed(node.as_date()->get());

        case toml::node_type::time:
            return streamed(node.as_time()->get());

        case toml::node_type::date_time:
            return streamed(node.as_date_time()->get());

        case toml::node_type::array: {
            List items;
            for (const auto& elem : *node.as_array()) {
                items.push_back(from_toml(elem));
            }
            return Node(std::move(items));
        }

        case toml::node_type::table: {
            Map map;
            for (const auto& [key, val] : *node.as_table()) {
                map.insert_or_assign(std::string(key.str()), from_toml(val));
            }
            return Node(std::move(map));
        }

        default:
            return Node();
    }
}

toml::array make_array(const List& items);
toml::table make_table(const Map& map);

// Appends one value to a table or array; `Sink` supplies the insertion.
template <typename Sink>
void put(const Node& value, Sink&& sink) {
    switch (value.kind()) {
        case NodeKind::Map:
            sink(make_table(value.as_map()));
            return;
        case NodeKind::List:
            sink(make_array(value.as_list()));
            return;
        case NodeKind::Scalar:
            break;
    }
    const Scalar& s = value.scalar();
    switch (s.kind()) {
        case ScalarKind::Null:
            sink(std::string{});
            break;
        case ScalarKind::Boolean:
            sink(s.as_boolean());
            break;
        case ScalarKind::Integer:
            sink(s.as_integer());
            break;
        case ScalarKind::Float:
            sink(s.as_float());
            break;
        case ScalarKind::String:
            sink(s.as_string());
            break;
    }
}

toml::array make_array(const List& items) {
    toml::array out;
    for (const auto& item : items) {
        put(item, [&out](auto&& v) { out.push_back(std::forward<decltype(v)>(v)); });
    }
    return out;
}

toml::table make_table(const Map& map) {
    toml::table tbl;
    for (std::size_t i = 0; i < map.size(); ++i) {
        const std::string& key = map.key_at(i);
        put(map.value_at(i), [&tbl, &key](auto&& v) {
            tbl.insert_or_assign(key, std::forward<decltype(v)>(v));
        });
    }
    return tbl;
}

} // anonymous namespace

Node TomlFormat::parse(const std::string& text) const {
    try {
        toml::table table = toml::parse(text);
        return from_toml(table);
    } catch (const toml::parse_error& e) {
        throw FormatParseError("toml", "line " + std::to_string(e.source().begin.line) + ", column " +
                                           std::to_string(e.source().begin.column) + ": " +
                                           std::string(e.description()));
    }
}

std::string TomlFormat::serialize(const Node& root) const {
    toml::table tbl;
    if (root.is_map()) {
        tbl = make_table(root.as_map());
    } else {
        put(root, [&tbl](auto&& v) { tbl.insert_or_assign("value", std::forward<decltype(v)>(v)); });
    }
    std::ostringstream ss;
    ss << tbl << "\n";
    return ss.str();
}

} // namespace graft

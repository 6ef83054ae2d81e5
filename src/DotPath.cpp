/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "graft/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace graft {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::optional<std::size_t> parse_list_index(const std::string& segment) {
    if (segment.empty()) return std::nullopt;
    if (segment[0] == '0' && segment.size() > 1) return std::nullopt;
    if (!std::all_of(segment.begin(), segment.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    std::size_t index = 0;
    const char* end = segment.data() + segment.size();
    const auto [ptr, ec] = std::from_chars(segment.data(), end, index);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;  // out of range
    }
    return index;
}

namespace {

    /**
     * @brief One traversal step shared by the getters
     * @return The child, or nullptr if it does not exist
     * @throws TypeMismatchError if @p current is a scalar
     */
    const Node* child_of(const Node& current, const std::string& seg, const std::string& path) {
        switch (current.kind()) {
            case NodeKind::Map:
                return current.as_map().find(seg);
            case NodeKind::List: {
                const auto idx = parse_list_index(seg);
                if (!idx) {
                    return nullptr;
                }
                const auto& items = current.as_list();
                return *idx < items.size() ? &items[*idx] : nullptr;
            }
            case NodeKind::Scalar:
                break;
        }
        throw TypeMismatchError(path, "map or list", kind_name(current));
    }
}

const Node* get_by_dot(const Node& data, const std::string& path) {
    const Node* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = child_of(*current, seg, path);
        if (!current) {
            throw KeyError(path, seg);
        }
    }
    return current;
}

void set_by_dot(Node& data, const std::string& path, const Node& value, bool create_missing) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Node* current = &data;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        const bool last = i + 1 == segments.size();

        const auto index = current->is_list() ? parse_list_index(seg) : std::optional<std::size_t>{};
        if (current->is_list() && !index && !seg.empty() &&
            seg.find_first_not_of("0123456789") == std::string::npos) {
            throw KeyError(path, seg + " (invalid list index)");
        }
        if (index) {
            auto& items = current->as_list();
            const size_t idx = *index;
            if (idx >= items.size()) {
                throw KeyError(path, seg + " (index out of range)");
            }
            if (last) {
                items[idx] = value;
                return;
            }
            current = &items[idx];
            continue;
        }

        if (!current->is_map()) {
            if (!create_missing) {
                throw TypeMismatchError(path, "map", kind_name(*current));
            }
            *current = Node::map();
        }

        Map& map = current->as_map();
        if (last) {
            map.insert_or_assign(seg, value);
            return;
        }
        Node* next = map.find(seg);
        if (!next) {
            if (!create_missing) {
                throw KeyError(path, seg);
            }
            next = &map.insert_or_assign(seg, Node::map());
        }
        current = next;
    }
}

bool contains_dot(const Node& data, const std::string& path) {
    const Node* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = child_of(*current, seg, path);
        if (!current) {
            return false;
        }
    }
    return true;
}

} // namespace graft

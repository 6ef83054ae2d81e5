/**
 * @file Resolver.cpp
 * @brief Implementation of selector path resolution
 */

#include "graft/Resolver.hpp"
#include "graft/Errors.hpp"

#include <algorithm>
#include <optional>

namespace graft {

namespace {

struct Child {
    PathStep step;
    const Node* node;
};

/**
 * @brief Yields the next child of a frame for one segment kind
 *
 * `cursor` is the position in the container (or 1 once a literal
 * has been tried); it only moves forward.
 */
class ChildFinder {
public:
    ChildFinder(const Node& node, std::size_t& cursor) : node_(node), cursor_(cursor) {}

    std::optional<Child> operator()(const Literal& lit) const {
        if (cursor_ > 0 || !node_.is_map()) {
            return std::nullopt;
        }
        cursor_ = 1;
        if (const Node* child = node_.as_map().find(lit.name)) {
            return Child{lit.name, child};
        }
        return std::nullopt;
    }

    std::optional<Child> operator()(const Group& group) const {
        if (!node_.is_map()) {
            return std::nullopt;
        }
        // Walk the map, not the alternatives, to keep document order.
        const Map& map = node_.as_map();
        while (cursor_ < map.size()) {
            const std::size_t i = cursor_++;
            const auto& key = map.key_at(i);
            if (std::find(group.alternatives.begin(), group.alternatives.end(), key) !=
                group.alternatives.end()) {
                return Child{key, &map.value_at(i)};
            }
        }
        return std::nullopt;
    }

    std::optional<Child> operator()(const Wildcard&) const {
        switch (node_.kind()) {
            case NodeKind::List: {
                const auto& items = node_.as_list();
                if (cursor_ < items.size()) {
                    const std::size_t i = cursor_++;
                    return Child{i, &items[i]};
                }
                return std::nullopt;
            }
            case NodeKind::Map: {
                const Map& map = node_.as_map();
                if (cursor_ < map.size()) {
                    const std::size_t i = cursor_++;
                    return Child{map.key_at(i), &map.value_at(i)};
                }
                return std::nullopt;
            }
            case NodeKind::Scalar:
                return std::nullopt;
        }
        return std::nullopt;
    }

private:
    const Node& node_;
    std::size_t& cursor_;
};

/// Applies one step, throwing if it does not exist.
template <typename NodeT>
NodeT& step_into(NodeT& node, const PathStep& step, const MatchLocation& location) {
    if (const auto* key = std::get_if<std::string>(&step)) {
        if (!node.is_map()) {
            throw TypeMismatchError(to_string(location), "map", kind_name(node));
        }
        auto* child = node.as_map().find(*key);
        if (!child) {
            throw KeyError(to_string(location), *key);
        }
        return *child;
    }
    const std::size_t index = std::get<std::size_t>(step);
    if (!node.is_list()) {
        throw TypeMismatchError(to_string(location), "list", kind_name(node));
    }
    auto& items = node.as_list();
    if (index >= items.size()) {
        throw KeyError(to_string(location), std::to_string(index) + " (index out of range)");
    }
    return items[index];
}

template <typename NodeT>
NodeT& locate_impl(NodeT& root, const MatchLocation& location) {
    NodeT* current = &root;
    for (const auto& step : location.steps()) {
        current = &step_into(*current, step, location);
    }
    return *current;
}

} // anonymous namespace

std::string to_string(const MatchLocation& location) {
    if (location.is_root()) {
        return "(root)";
    }
    std::string out;
    for (const auto& step : location.steps()) {
        if (const auto* key = std::get_if<std::string>(&step)) {
            if (!out.empty()) out += '.';
            out += *key;
        } else {
            out += "[" + std::to_string(std::get<std::size_t>(step)) + "]";
        }
    }
    return out;
}

const Node& locate(const Node& root, const MatchLocation& location) {
    return locate_impl(root, location);
}

Node& locate(Node& root, const MatchLocation& location) {
    return locate_impl(root, location);
}

// ============================================================================
// MatchRange
// ============================================================================

MatchRange::iterator::iterator(const Node* root, const std::vector<PathSegment>* segments,
                               bool lists_whole)
    : segments_(segments)
    , lists_whole_(lists_whole)
    , done_(false)
{
    stack_.push_back(Frame{root, 0});
    advance();
}

void MatchRange::iterator::pop() {
    stack_.pop_back();
    if (!path_.empty()) {
        path_.pop_back();
    }
}

bool MatchRange::iterator::yields_whole_list(const Frame& frame, std::size_t depth) const {
    return lists_whole_ && depth + 1 == segments_->size() && frame.node->is_list() &&
           std::holds_alternative<Wildcard>((*segments_)[depth]);
}

void MatchRange::iterator::advance() {
    // Invariant: path_.size() == stack_.size() - 1
    while (!stack_.empty()) {
        const std::size_t depth = stack_.size() - 1;
        if (depth == segments_->size()) {
            current_ = MatchLocation(path_);
            pop();
            return;
        }

        Frame& top = stack_.back();
        if (yields_whole_list(top, depth)) {
            // Emitted once; the cursor marks it as done.
            if (top.cursor == 0) {
                top.cursor = 1;
                current_ = MatchLocation(path_);
                return;
            }
            pop();
            continue;
        }

        std::optional<Child> child =
            std::visit(ChildFinder(*top.node, top.cursor), (*segments_)[depth]);
        if (!child) {
            pop();
            continue;
        }
        path_.push_back(std::move(child->step));
        stack_.push_back(Frame{child->node, 0});
    }
    done_ = true;
}

std::size_t MatchRange::count() const {
    std::size_t n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

MatchRange resolve(const Node& tree, const Selector& selector) {
    const bool keyed = selector.instruction &&
                       std::holds_alternative<KeyedUpdate>(*selector.instruction);
    return MatchRange(tree, selector.segments, keyed);
}

} // namespace graft

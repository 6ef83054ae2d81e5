/**
 * @file Resolver.hpp
 * @brief Resolving selector paths against a document tree
 *
 * resolve() walks a tree one level per path segment:
 * - Literal(name): descend into map key `name`; absent -> no match
 * - Group(alts): descend into every present alternative; absent ones are skipped
 * - Wildcard: descend into every list element / map value; scalars -> no match
 *
 * Matches come out in document order. Nothing is created in the tree.
 *
 * A keyed-update instruction scans the elements of a list itself, so
 * for such a selector a final Wildcard that meets a list yields the
 * list rather than each element. `environment.preview.[].(name=x on
 * value from y)` therefore locates `environment.preview`.
 */

#ifndef GRAFT_RESOLVER_HPP
#define GRAFT_RESOLVER_HPP

#include "graft/Selector.hpp"
#include "graft/Value.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <variant>
#include <vector>

namespace graft {

/// One step from a container to a child: map key or list index.
using PathStep = std::variant<std::string, std::size_t>;

/**
 * @brief Non-owning handle to a position in a tree
 *
 * Stored as the path of steps from the root, so it never points into
 * the tree. Turn it into a node with locate().
 */
class MatchLocation {
public:
    MatchLocation() = default;
    explicit MatchLocation(std::vector<PathStep> steps) : steps_(std::move(steps)) {}

    const std::vector<PathStep>& steps() const noexcept { return steps_; }
    bool is_root() const noexcept { return steps_.empty(); }
    std::size_t depth() const noexcept { return steps_.size(); }

    friend bool operator==(const MatchLocation& a, const MatchLocation& b) {
        return a.steps_ == b.steps_;
    }
    friend bool operator!=(const MatchLocation& a, const MatchLocation& b) { return !(a == b); }

private:
    std::vector<PathStep> steps_;
};

/**
 * @brief Render a location, e.g. "environment.preview[1].value"
 *
 * The root renders as "(root)".
 */
std::string to_string(const MatchLocation& location);

/**
 * @brief Find the node a location refers to
 * @throws KeyError if a step no longer exists
 * @throws TypeMismatchError if a step crosses a node of the wrong kind
 */
const Node& locate(const Node& root, const MatchLocation& location);
Node& locate(Node& root, const MatchLocation& location);

/**
 * @brief Lazily produced sequence of match locations
 *
 * Each begin() starts a fresh depth-first walk with an explicit stack,
 * so the range can be iterated any number of times and never
 * materializes the full match list.
 *
 * The range refers to the tree and to the segment list; both must
 * outlive it. Iteration stays valid while nodes strictly below the
 * matched depth are modified.
 */
class MatchRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MatchLocation;
        using difference_type = std::ptrdiff_t;
        using pointer = const MatchLocation*;
        using reference = const MatchLocation&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            advance();
            return tmp;
        }

        /// Only comparison against end() is meaningful.
        friend bool operator==(const iterator& a, const iterator& b) { return a.done_ == b.done_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        friend class MatchRange;

        struct Frame {
            const Node* node;
            std::size_t cursor;
        };

        iterator(const Node* root, const std::vector<PathSegment>* segments, bool lists_whole);

        void advance();
        void pop();

        bool yields_whole_list(const Frame& frame, std::size_t depth) const;

        const std::vector<PathSegment>* segments_ = nullptr;
        bool lists_whole_ = false;
        std::vector<Frame> stack_;
        std::vector<PathStep> path_;
        MatchLocation current_;
        bool done_ = true;
    };

    /**
     * @param lists_whole If true, a final Wildcard over a list yields the
     *        list itself instead of its elements
     */
    MatchRange(const Node& root, const std::vector<PathSegment>& segments, bool lists_whole = false)
        : root_(&root), segments_(&segments), lists_whole_(lists_whole) {}

    // The range keeps pointers; temporaries would dangle.
    MatchRange(Node&&, const std::vector<PathSegment>&, bool = false) = delete;
    MatchRange(const Node&, std::vector<PathSegment>&&, bool = false) = delete;
    MatchRange(Node&&, std::vector<PathSegment>&&, bool = false) = delete;

    iterator begin() const { return iterator(root_, segments_, lists_whole_); }
    iterator end() const { return iterator(); }

    /// Walks the whole range once.
    std::size_t count() const;
    bool empty() const { return begin() == end(); }

private:
    const Node* root_;
    const std::vector<PathSegment>* segments_;
    bool lists_whole_;
};

/**
 * @brief Resolve the path segments of a selector against a tree
 *
 * A selector without path segments resolves to the root. With a
 * keyed-update instruction a final Wildcard over a list yields the list.
 *
 * @param tree Tree to search
 * @param selector Parsed selector (must outlive the range)
 * @return Lazy range of match locations, possibly empty
 *
 * Example:
 * ```cpp
 * auto sel = parse_selector("environment.(preview|prod).[]");
 * for (const auto& loc : resolve(doc, sel)) {
 *     std::cout << to_string(loc) << "\n";  // environment.preview[0], ...
 * }
 * ```
 */
MatchRange resolve(const Node& tree, const Selector& selector);

MatchRange resolve(Node&& tree, const Selector& selector) = delete;
MatchRange resolve(const Node& tree, Selector&& selector) = delete;
MatchRange resolve(Node&& tree, Selector&& selector) = delete;

} // namespace graft

#endif // GRAFT_RESOLVER_HPP

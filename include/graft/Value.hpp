/**
 * @file Value.hpp
 * @brief Universal document tree shared by every format
 *
 * A document is a tree of Node values. A Node is exactly one of:
 * - Scalar (null, boolean, integer, float, string)
 * - List   ([Node, ...], order significant)
 * - Map    ({String: Node, ...}, unique keys, insertion order preserved)
 *
 * The set of alternatives is closed: traversal code switches over
 * NodeKind and handles all three.
 */

#ifndef GRAFT_VALUE_HPP
#define GRAFT_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace graft {

class Node;

/// Alternatives of the Node union.
enum class NodeKind { Scalar, List, Map };

/// Alternatives of the Scalar union.
enum class ScalarKind { Null, Boolean, Integer, Float, String };

/**
 * @brief Leaf value of a document tree
 *
 * Integers and floats are kept apart so formats that distinguish them
 * (JSON, TOML) round-trip unchanged; they still compare numerically.
 */
class Scalar {
public:
    Scalar() = default;
    Scalar(std::nullptr_t) {}
    Scalar(bool b) : value_(b) {}
    Scalar(double d) : value_(d) {}
    Scalar(std::string s) : value_(std::move(s)) {}
    Scalar(const char* s) : value_(std::string(s)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Scalar(T i) : value_(static_cast<std::int64_t>(i)) {}

    ScalarKind kind() const noexcept;

    bool is_null() const noexcept { return kind() == ScalarKind::Null; }
    bool is_boolean() const noexcept { return kind() == ScalarKind::Boolean; }
    bool is_integer() const noexcept { return kind() == ScalarKind::Integer; }
    bool is_float() const noexcept { return kind() == ScalarKind::Float; }
    bool is_number() const noexcept { return is_integer() || is_float(); }
    bool is_string() const noexcept { return kind() == ScalarKind::String; }

    /// @throws TypeMismatchError if the scalar holds another kind
    bool as_boolean() const;
    std::int64_t as_integer() const;
    /// Integers widen to double.
    double as_float() const;
    const std::string& as_string() const;

    /**
     * @brief Normalized text form
     *
     * null -> "null", booleans -> "true"/"false", integers in decimal,
     * floats in shortest round-trip form ("2" for 2.0), strings verbatim.
     * This is the form KeyedUpdate compares target values against.
     */
    std::string to_string() const;

    friend bool operator==(const Scalar& a, const Scalar& b);
    friend bool operator!=(const Scalar& a, const Scalar& b) { return !(a == b); }

private:
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string> value_{nullptr};
};

/**
 * @brief Ordered string-keyed mapping
 *
 * Keys and values are stored in insertion order; an index gives O(1)
 * average lookup. Overwriting an existing key keeps its position.
 */
class Map {
public:
    Map() = default;
    Map(std::initializer_list<std::pair<std::string, Node>> entries);

    std::size_t size() const noexcept { return keys_.size(); }
    bool empty() const noexcept { return keys_.empty(); }

    bool contains(const std::string& key) const;

    /// @return pointer to the value, or nullptr when absent
    const Node* find(const std::string& key) const;
    Node* find(const std::string& key);

    /// @throws KeyError if absent
    const Node& at(const std::string& key) const;
    Node& at(const std::string& key);

    /// Returns the value for @p key, inserting a null scalar if absent.
    Node& operator[](const std::string& key);

    /// Sets @p key, appending it if absent. Returns the stored value.
    Node& insert_or_assign(const std::string& key, Node value);

    /// @return true if the key was present
    bool erase(const std::string& key);

    const std::string& key_at(std::size_t i) const { return keys_.at(i); }
    const Node& value_at(std::size_t i) const;
    Node& value_at(std::size_t i);

    const std::vector<std::string>& keys() const noexcept { return keys_; }

    /// Order-insensitive: same key set, equal values.
    friend bool operator==(const Map& a, const Map& b);
    friend bool operator!=(const Map& a, const Map& b) { return !(a == b); }

private:
    std::vector<std::string> keys_;
    std::vector<Node> values_;
    std::unordered_map<std::string, std::size_t> index_;
};

/**
 * @brief One node of a document tree
 *
 * Copying a Node deep-copies the whole subtree; copies never share
 * structure with their source.
 */
class Node {
public:
    using List = std::vector<Node>;

    Node() = default;
    Node(Scalar s) : data_(std::move(s)) {}
    Node(std::nullptr_t) {}
    Node(bool b) : data_(Scalar(b)) {}
    Node(double d) : data_(Scalar(d)) {}
    Node(std::string s) : data_(Scalar(std::move(s))) {}
    Node(const char* s) : data_(Scalar(s)) {}
    Node(List l) : data_(std::move(l)) {}
    Node(Map m) : data_(std::move(m)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Node(T i) : data_(Scalar(i)) {}

    static Node list(std::initializer_list<Node> items = {});
    static Node map(std::initializer_list<std::pair<std::string, Node>> entries = {});

    NodeKind kind() const noexcept { return static_cast<NodeKind>(data_.index()); }
    bool is_scalar() const noexcept { return kind() == NodeKind::Scalar; }
    bool is_list() const noexcept { return kind() == NodeKind::List; }
    bool is_map() const noexcept { return kind() == NodeKind::Map; }
    bool is_null() const noexcept { return is_scalar() && scalar().is_null(); }

    /// @throws TypeMismatchError on the wrong alternative
    const Scalar& scalar() const;
    Scalar& scalar();
    const List& as_list() const;
    List& as_list();
    const Map& as_map() const;
    Map& as_map();

    /// Map lookup. @throws TypeMismatchError if not a map, KeyError if absent
    const Node& at(const std::string& key) const;
    Node& at(const std::string& key);
    /// List lookup. @throws TypeMismatchError if not a list, KeyError if out of range
    const Node& at(std::size_t index) const;
    Node& at(std::size_t index);

    /// false for non-maps
    bool contains(const std::string& key) const;

    /// Number of children; 0 for scalars.
    std::size_t size() const noexcept;

    friend bool operator==(const Node& a, const Node& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Node& a, const Node& b) { return !(a == b); }

private:
    // Alternative order must match NodeKind.
    std::variant<Scalar, List, Map> data_;
};

using List = Node::List;

/**
 * @brief Human-readable kind name for diagnostics
 * @return "null", "boolean", "integer", "float", "string", "list" or "map"
 */
std::string kind_name(const Node& node);

/// Compact single-line rendering, e.g. {a: [1, "x"]}. Used in log output.
std::string to_display_string(const Node& node);

} // namespace graft

#endif // GRAFT_VALUE_HPP

/**
 * @file Value.cpp
 * @brief Implementation of the document tree
 */

#include "graft/Value.hpp"
#include "graft/Errors.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace graft {

namespace {
    const char* scalar_kind_name(ScalarKind k) {
        switch (k) {
            case ScalarKind::Null: return "null";
            case ScalarKind::Boolean: return "boolean";
            case ScalarKind::Integer: return "integer";
            case ScalarKind::Float: return "float";
            case ScalarKind::String: return "string";
        }
        return "unknown";
    }

    std::string format_double(double d) {
        if (std::isnan(d)) return "nan";
        if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

        // Integral values print without a fraction: 2.0 -> "2"
        if (d == std::floor(d) && std::fabs(d) < 1e15) {
            std::ostringstream oss;
            oss << static_cast<std::int64_t>(d);
            return oss.str();
        }

        // Shortest precision that round-trips
        for (int precision = 15; precision <= 17; ++precision) {
            std::ostringstream oss;
            oss << std::setprecision(precision) << d;
            if (std::stod(oss.str()) == d) {
                return oss.str();
            }
        }
        std::ostringstream oss;
        oss << std::setprecision(17) << d;
        return oss.str();
    }

    std::string quote(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out + "\"";
    }

    void display(const Node& node, std::ostringstream& out) {
        switch (node.kind()) {
            case NodeKind::Scalar: {
                const Scalar& s = node.scalar();
                out << (s.is_string() ? quote(s.as_string()) : s.to_string());
                break;
            }
            case NodeKind::List: {
                out << '[';
                const auto& items = node.as_list();
                for (std::size_t i = 0; i < items.size(); ++i) {
                    if (i > 0) out << ", ";
                    display(items[i], out);
                }
                out << ']';
                break;
            }
            case NodeKind::Map: {
                out << '{';
                const auto& map = node.as_map();
                for (std::size_t i = 0; i < map.size(); ++i) {
                    if (i > 0) out << ", ";
                    out << map.key_at(i) << ": ";
                    display(map.value_at(i), out);
                }
                out << '}';
                break;
            }
        }
    }
} // anonymous namespace

// ============================================================================
// Scalar
// ============================================================================

ScalarKind Scalar::kind() const noexcept {
    return static_cast<ScalarKind>(value_.index());
}

bool Scalar::as_boolean() const {
    if (!is_boolean()) {
        throw TypeMismatchError(to_string(), "boolean", scalar_kind_name(kind()));
    }
    return std::get<bool>(value_);
}

std::int64_t Scalar::as_integer() const {
    if (!is_integer()) {
        throw TypeMismatchError(to_string(), "integer", scalar_kind_name(kind()));
    }
    return std::get<std::int64_t>(value_);
}

double Scalar::as_float() const {
    if (is_integer()) {
        return static_cast<double>(std::get<std::int64_t>(value_));
    }
    if (!is_float()) {
        throw TypeMismatchError(to_string(), "float", scalar_kind_name(kind()));
    }
    return std::get<double>(value_);
}

const std::string& Scalar::as_string() const {
    if (!is_string()) {
        throw TypeMismatchError(to_string(), "string", scalar_kind_name(kind()));
    }
    return std::get<std::string>(value_);
}

std::string Scalar::to_string() const {
    switch (kind()) {
        case ScalarKind::Null: return "null";
        case ScalarKind::Boolean: return std::get<bool>(value_) ? "true" : "false";
        case ScalarKind::Integer: return std::to_string(std::get<std::int64_t>(value_));
        case ScalarKind::Float: return format_double(std::get<double>(value_));
        case ScalarKind::String: return std::get<std::string>(value_);
    }
    return {};
}

bool operator==(const Scalar& a, const Scalar& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_integer() && b.is_integer()) {
            return a.as_integer() == b.as_integer();
        }
        return a.as_float() == b.as_float();
    }
    return a.value_ == b.value_;
}

// ============================================================================
// Map
// ============================================================================

Map::Map(std::initializer_list<std::pair<std::string, Node>> entries) {
    for (const auto& [key, value] : entries) {
        insert_or_assign(key, value);
    }
}

bool Map::contains(const std::string& key) const {
    return index_.count(key) > 0;
}

const Node* Map::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &values_[it->second];
}

Node* Map::find(const std::string& key) {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &values_[it->second];
}

const Node& Map::at(const std::string& key) const {
    const Node* n = find(key);
    if (!n) throw KeyError(key, key);
    return *n;
}

Node& Map::at(const std::string& key) {
    Node* n = find(key);
    if (!n) throw KeyError(key, key);
    return *n;
}

Node& Map::operator[](const std::string& key) {
    if (Node* n = find(key)) {
        return *n;
    }
    return insert_or_assign(key, Node());
}

Node& Map::insert_or_assign(const std::string& key, Node value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        values_[it->second] = std::move(value);
        return values_[it->second];
    }
    index_.emplace(key, keys_.size());
    keys_.push_back(key);
    values_.push_back(std::move(value));
    return values_.back();
}

bool Map::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    const std::size_t pos = it->second;
    keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(pos));
    values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(pos));
    index_.erase(it);
    for (auto& entry : index_) {
        if (entry.second > pos) --entry.second;
    }
    return true;
}

const Node& Map::value_at(std::size_t i) const {
    return values_.at(i);
}

Node& Map::value_at(std::size_t i) {
    return values_.at(i);
}

bool operator==(const Map& a, const Map& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        const Node* other = b.find(a.keys_[i]);
        if (!other || *other != a.values_[i]) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Node
// ============================================================================

Node Node::list(std::initializer_list<Node> items) {
    return Node(List(items));
}

Node Node::map(std::initializer_list<std::pair<std::string, Node>> entries) {
    return Node(Map(entries));
}

const Scalar& Node::scalar() const {
    if (!is_scalar()) throw TypeMismatchError(to_display_string(*this), "scalar", kind_name(*this));
    return std::get<Scalar>(data_);
}

Scalar& Node::scalar() {
    if (!is_scalar()) throw TypeMismatchError(to_display_string(*this), "scalar", kind_name(*this));
    return std::get<Scalar>(data_);
}

const Node::List& Node::as_list() const {
    if (!is_list()) throw TypeMismatchError(to_display_string(*this), "list", kind_name(*this));
    return std::get<List>(data_);
}

Node::List& Node::as_list() {
    if (!is_list()) throw TypeMismatchError(to_display_string(*this), "list", kind_name(*this));
    return std::get<List>(data_);
}

const Map& Node::as_map() const {
    if (!is_map()) throw TypeMismatchError(to_display_string(*this), "map", kind_name(*this));
    return std::get<Map>(data_);
}

Map& Node::as_map() {
    if (!is_map()) throw TypeMismatchError(to_display_string(*this), "map", kind_name(*this));
    return std::get<Map>(data_);
}

const Node& Node::at(const std::string& key) const {
    return as_map().at(key);
}

Node& Node::at(const std::string& key) {
    return as_map().at(key);
}

const Node& Node::at(std::size_t index) const {
    const auto& items = as_list();
    if (index >= items.size()) {
        throw KeyError("[" + std::to_string(index) + "]", std::to_string(index) + " (index out of range)");
    }
    return items[index];
}

Node& Node::at(std::size_t index) {
    auto& items = as_list();
    if (index >= items.size()) {
        throw KeyError("[" + std::to_string(index) + "]", std::to_string(index) + " (index out of range)");
    }
    return items[index];
}

bool Node::contains(const std::string& key) const {
    return is_map() && std::get<Map>(data_).contains(key);
}

std::size_t Node::size() const noexcept {
    switch (kind()) {
        case NodeKind::Scalar: return 0;
        case NodeKind::List: return std::get<List>(data_).size();
        case NodeKind::Map: return std::get<Map>(data_).size();
    }
    return 0;
}

std::string kind_name(const Node& node) {
    switch (node.kind()) {
        case NodeKind::Scalar: return scalar_kind_name(node.scalar().kind());
        case NodeKind::List: return "list";
        case NodeKind::Map: return "map";
    }
    return "unknown";
}

std::string to_display_string(const Node& node) {
    std::ostringstream out;
    display(node, out);
    return out.str();
}

} // namespace graft

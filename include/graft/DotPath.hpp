/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for nested document access
 *
 * Provides functions for accessing nested values using dot-separated
 * paths like "database.host" or "environment.preview.0.value".
 * Numeric segments index into lists.
 *
 * Rules:
 * - get_by_dot() raises KeyError if the path doesn't exist
 * - set_by_dot() with create_missing=false raises for missing segments
 * - set_by_dot() with create_missing=true creates intermediate maps
 * - contains_dot() returns false for missing segments
 */

#ifndef GRAFT_DOTPATH_HPP
#define GRAFT_DOTPATH_HPP

#include "graft/Errors.hpp"
#include "graft/Value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace graft {

/**
 * @brief Split a dot-path into segments
 *
 * Examples:
 * - "database.host" -> ["database", "host"]
 * - "" -> []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Read a segment as a list index
 *
 * Accepts decimal digits without leading zeros ("0", "12").
 *
 * @return The index, or nullopt for any other segment, including one
 *         too large for std::size_t
 */
std::optional<std::size_t> parse_list_index(const std::string& segment);

/**
 * @brief Get value from nested structure using dot-path (strict)
 *
 * @return Pointer to the value at path (the root for an empty path)
 * @throws KeyError if any segment is not found
 * @throws TypeMismatchError if traversal hits a scalar before the final segment
 *
 * Example:
 * ```cpp
 * Node cfg = Node::map({{"db", Node::map({{"host", "localhost"}})}});
 * auto* val = get_by_dot(cfg, "db.host");    // "localhost"
 * get_by_dot(cfg, "db.port");                // throws KeyError
 * get_by_dot(cfg, "db.host.x");              // throws TypeMismatchError
 * ```
 */
const Node* get_by_dot(const Node& data, const std::string& path);

/**
 * @brief Set value in nested structure using dot-path
 *
 * @param create_missing If true, create intermediate maps (replacing
 *        scalars in the way); if false, raise for missing intermediates
 * @throws KeyError if create_missing=false and a segment is not found
 * @throws TypeMismatchError if create_missing=false and an intermediate
 *         is not a container
 */
void set_by_dot(Node& data, const std::string& path, const Node& value,
                bool create_missing = true);

/**
 * @brief Check if dot-path exists
 * @throws TypeMismatchError if traversal hits a scalar before the final segment
 */
bool contains_dot(const Node& data, const std::string& path);

} // namespace graft

#endif // GRAFT_DOTPATH_HPP

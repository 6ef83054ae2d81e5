/**
 * @file EnvMapper.hpp
 * @brief Environment variable collection and mapping for tool settings
 *
 * Variables named PREFIX_REST are turned into setting keys:
 * 1. strip the prefix (case-insensitive)
 * 2. lowercase, `_` -> `.`, `__` -> literal `_`
 * 3. remap against the known keys, so GRAFT_OUTPUT_FORMAT finds
 *    "output_format" and GRAFT_MERGE_STRICT finds "merge.strict"
 *
 * Variables whose key is not known are dropped.
 */

#ifndef GRAFT_ENVMAPPER_HPP
#define GRAFT_ENVMAPPER_HPP

#include "graft/Value.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace graft {

/**
 * @brief Transform an environment variable name into a dot path
 *
 * Examples:
 *   - MERGE_STRICT -> merge.strict
 *   - LOG__LEVEL -> log_level
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Strip "PREFIX_" from a variable name (case-insensitive)
 * @return The rest of the name, or empty string if no match
 */
std::string strip_prefix(const std::string& var_name, const std::string& prefix);

/**
 * @brief Collect the variables of the current environment named PREFIX_*
 * @return (name, value) pairs with the original full names
 */
std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix);

/**
 * @brief Every dot path of a nested map, containers included
 *
 * {"merge": {"strict": false}} -> {"merge", "merge.strict"}
 */
std::set<std::string> flatten_keys(const Node& data, const std::string& prefix = "");

/**
 * @brief Find the known key an env-derived dot path stands for
 *
 * Tries the path as is, then every way of re-joining its segments with
 * `_` instead of `.` (so "output.format" finds "output_format").
 *
 * @return The matching key, or empty string when none matches
 */
std::string remap_env_key(const std::string& dot_path, const std::set<std::string>& known_keys);

/**
 * @brief Full pipeline: collect, transform, remap and type (parse_value)
 *
 * @param env_vars (name, value) pairs, usually from collect_env_vars()
 * @return (setting key, typed value) pairs, unknown keys dropped
 */
std::vector<std::pair<std::string, Node>> map_env_vars(
    const std::vector<std::pair<std::string, std::string>>& env_vars,
    const std::string& prefix,
    const Node& known
);

} // namespace graft

#endif // GRAFT_ENVMAPPER_HPP

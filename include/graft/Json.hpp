/**
 * @file Json.hpp
 * @brief Conversions between the document tree and nlohmann::json
 */

#ifndef GRAFT_JSON_HPP
#define GRAFT_JSON_HPP

#include "graft/Value.hpp"

#include <nlohmann/json.hpp>

namespace graft {

/// Key order of objects is preserved. Unsigned values above INT64_MAX become floats.
Node node_from_json(const nlohmann::ordered_json& j);

nlohmann::ordered_json node_to_json(const Node& node);

} // namespace graft

#endif // GRAFT_JSON_HPP

/**
 * @file Parse.hpp
 * @brief String-to-Node type parsing utilities
 *
 * Used for CLI overrides, environment values and the text content of
 * untyped formats (XML text, YAML plain scalars, record-format values).
 *
 * Parsing order (first match wins):
 * - T1: Boolean ("true", "false" - case insensitive)
 * - T2: Null ("null" - case insensitive)
 * - T3: Integer (matches ^-?[0-9]+$)
 * - T4: Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - T5: JSON Compound ({...} or [...])
 * - T6: Quoted String ("...")
 * - T7: Raw String (fallback)
 */

#ifndef GRAFT_PARSE_HPP
#define GRAFT_PARSE_HPP

#include "graft/Value.hpp"
#include <string>

namespace graft {

/**
 * @brief Parse string value to appropriate type (rules T1-T7)
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // -> true (boolean)
 * parse_value("null")       // -> null
 * parse_value("42")         // -> 42 (integer)
 * parse_value("3.14")       // -> 3.14 (float)
 * parse_value("[1,2,3]")    // -> [1, 2, 3] (list)
 * parse_value("\"hello\"")  // -> "hello" (string, unquoted)
 * parse_value("hello")      // -> "hello" (string)
 * ```
 */
Node parse_value(const std::string& str);

/**
 * @brief Type a plain scalar with rules T1-T4, else keep it as a string
 *
 * Unlike parse_value() this never parses JSON and never strips quotes.
 */
Scalar parse_scalar(const std::string& str);

/**
 * @brief Text for a float that parse_scalar() reads back as a float
 *
 * Adds the fraction Scalar::to_string() leaves out: 2.0 -> "2.0",
 * 1e20 -> "1.0e+20". Non-finite values render as "nan", "inf", "-inf".
 */
std::string float_text(double value);

} // namespace graft

#endif // GRAFT_PARSE_HPP

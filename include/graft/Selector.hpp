/**
 * @file Selector.hpp
 * @brief Selector AST and parser
 *
 * A selector names where in a base document to merge, and optionally how:
 *
 * ```
 * selector    := segment ('.' segment)*
 * segment     := literal | group | wildcard | instruction
 * literal     := name | 'quoted name' | "quoted name"
 * group       := '(' name ('|' name)* ')'
 * wildcard    := '[' ']'
 * instruction := '(' key_field '=' target 'on' value_field 'from' source ')'
 *              | '(' field (',' field)* 'from' source ')'
 * ```
 *
 * An instruction may only be the last segment. Examples:
 * - `environment.dev`
 * - `environment.(preview|prod).[].(name=allowedIps on value from Ips)`
 * - `api_config.(keys from api_keys)`
 */

#ifndef GRAFT_SELECTOR_HPP
#define GRAFT_SELECTOR_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace graft {

/// Matches exactly one map key.
struct Literal {
    std::string name;

    friend bool operator==(const Literal& a, const Literal& b) { return a.name == b.name; }
};

/// Matches every alternative present as a map key, each as its own branch.
struct Group {
    std::vector<std::string> alternatives;

    friend bool operator==(const Group& a, const Group& b) {
        return a.alternatives == b.alternatives;
    }
};

/// Matches every list element or every map value.
struct Wildcard {
    friend bool operator==(const Wildcard&, const Wildcard&) { return true; }
};

using PathSegment = std::variant<Literal, Group, Wildcard>;

/**
 * @brief `(key_field=target_value on value_field from source_key)`
 *
 * Applies to a list of maps: the element whose key_field equals
 * target_value gets value_field set from the input's source_key.
 */
struct KeyedUpdate {
    std::string key_field;
    std::string target_value;
    std::string value_field;
    std::string source_key;

    friend bool operator==(const KeyedUpdate& a, const KeyedUpdate& b) {
        return a.key_field == b.key_field && a.target_value == b.target_value &&
               a.value_field == b.value_field && a.source_key == b.source_key;
    }
};

/// One `dest_field <- source_key` assignment of a DirectAssign.
struct FieldAssignment {
    std::string dest_field;
    std::string source_key;

    friend bool operator==(const FieldAssignment& a, const FieldAssignment& b) {
        return a.dest_field == b.dest_field && a.source_key == b.source_key;
    }
};

/**
 * @brief `(field, ... from source_key)`
 *
 * Applies to a map: each dest_field is set from the input's source_key.
 */
struct DirectAssign {
    std::vector<FieldAssignment> fields;

    friend bool operator==(const DirectAssign& a, const DirectAssign& b) {
        return a.fields == b.fields;
    }
};

using MergeInstruction = std::variant<KeyedUpdate, DirectAssign>;

/**
 * @brief Parsed selector: path segments plus an optional trailing instruction
 *
 * Immutable once parsed.
 */
struct Selector {
    std::vector<PathSegment> segments;
    std::optional<MergeInstruction> instruction;

    friend bool operator==(const Selector& a, const Selector& b) {
        return a.segments == b.segments && a.instruction == b.instruction;
    }
    friend bool operator!=(const Selector& a, const Selector& b) { return !(a == b); }
};

/**
 * @brief Parse selector text
 *
 * @param text Selector string
 * @return Parsed Selector
 * @throws SelectorSyntaxError for malformed text (empty segments,
 *         unterminated groups or quotes, instruction not last, ...)
 * @throws MergeInstructionError for instructions missing 'on'/'from'
 *         or operands
 *
 * Examples:
 * ```cpp
 * auto s = parse_selector("environment.(preview|prod).[]");
 * // segments: Literal{environment}, Group{preview, prod}, Wildcard
 *
 * parse_selector("environment..preview");   // throws SelectorSyntaxError
 * parse_selector("a.(keys api_keys)");      // throws MergeInstructionError
 * ```
 */
Selector parse_selector(const std::string& text);

/**
 * @brief Render a selector as canonical text
 *
 * Names that would not scan as bare words are quoted. Parsing the
 * result yields an equal Selector.
 *
 * @throws std::invalid_argument for a name that needs quoting but holds
 *         both `'` and `"`; parse_selector() never produces one
 */
std::string to_string(const Selector& selector);

/// Canonical text of a single segment (used in diagnostics).
std::string to_string(const PathSegment& segment);

/// Canonical text of an instruction, including parentheses.
std::string to_string(const MergeInstruction& instruction);

} // namespace graft

#endif // GRAFT_SELECTOR_HPP

/**
 * @file Evaluator.hpp
 * @brief Applying merge instructions at resolved locations
 *
 * - KeyedUpdate: each location must hold a list; in it, the element
 *   whose `key_field` normalizes to `target_value` gets `value_field`
 *   set from the input
 * - DirectAssign: each location must hold a map; every listed field is
 *   set from the input, created if absent
 * - Overlay (no instruction): the input root map is deep-merged into
 *   each location, which must hold a map
 *
 * All three validate every location before writing anything, so a
 * TypeMismatchError or DuplicateTargetError leaves the base untouched.
 * The input tree is only read; written values are deep copies.
 */

#ifndef GRAFT_EVALUATOR_HPP
#define GRAFT_EVALUATOR_HPP

#include "graft/Resolver.hpp"
#include "graft/Selector.hpp"
#include "graft/Value.hpp"

#include <cstddef>
#include <string>

namespace graft {

/**
 * @brief What a KeyedUpdate does when several list elements match
 */
enum class DuplicatePolicy {
    First,  ///< update the first matching element only
    All,    ///< update every matching element
    Error   ///< throw DuplicateTargetError
};

/// @throws std::invalid_argument for names other than first, all, error
DuplicatePolicy parse_duplicate_policy(const std::string& name);
std::string to_string(DuplicatePolicy policy);

struct MergeOptions {
    DuplicatePolicy duplicates = DuplicatePolicy::First;
    /// Throw NoMatchError when nothing was applied
    bool require_match = false;
};

/**
 * @brief Counts gathered over one merge
 */
struct MergeReport {
    std::size_t locations = 0;  ///< resolved locations
    std::size_t applied = 0;    ///< locations written
    std::size_t unmatched = 0;  ///< KeyedUpdate locations without a matching element

    friend bool operator==(const MergeReport& a, const MergeReport& b) {
        return a.locations == b.locations && a.applied == b.applied && a.unmatched == b.unmatched;
    }
};

/**
 * @brief Look up a source key in the input tree
 *
 * Tried in order: the key verbatim at the root, the key as a dot path,
 * then the same two lookups inside each top-level map of the root
 * (so record-format sections can supply keys by bare name).
 *
 * @throws KeyError when the key is found nowhere
 */
const Node& find_source(const Node& input, const std::string& source_key);

/**
 * @brief Evaluate an instruction at every location of a range
 *
 * @param base Tree the range was resolved against; written in place
 * @param locations Range over @p base
 * @throws KeyError if a source key is missing (before any write)
 * @throws TypeMismatchError if a location has the wrong shape
 * @throws DuplicateTargetError under DuplicatePolicy::Error
 */
MergeReport apply_instruction(Node& base, const MatchRange& locations,
                              const MergeInstruction& instruction, const Node& input,
                              const MergeOptions& options = {});

/**
 * @brief Deep-merge the input root into every location
 * @throws TypeMismatchError if the input root or a location is not a map
 */
MergeReport apply_overlay(Node& base, const MatchRange& locations, const Node& input);

} // namespace graft

#endif // GRAFT_EVALUATOR_HPP

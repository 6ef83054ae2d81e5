/**
 * @file Merge.hpp
 * @brief The merge operation: selector + base + input -> merged base
 *
 * merge() parses the selector once, resolves it against the base tree
 * and evaluates the trailing instruction at every location, using the
 * input tree as the value source. A selector without an instruction
 * deep-merges the input into every location instead.
 *
 * Zero matches is not a failure by itself; it shows up in the report.
 * Set MergeOptions::require_match to turn it into a NoMatchError.
 */

#ifndef GRAFT_MERGE_HPP
#define GRAFT_MERGE_HPP

#include "graft/Evaluator.hpp"
#include "graft/Value.hpp"

#include <string>
#include <vector>

namespace graft {

/**
 * @brief A tree plus the name of the format it came from
 *
 * The merge never looks at `format`; it travels along for the writer.
 */
struct Document {
    Node root;
    std::string format;
};

struct MergeResult {
    Document document;
    MergeReport report;
};

/**
 * @brief Deep merge two trees
 *
 * Merging rules:
 * - Both maps: keys from both are combined, shared keys merged recursively
 * - Null overlay: base is kept
 * - Anything else: overlay replaces base
 *
 * Examples:
 * ```cpp
 * Node base = Node::map({{"db", Node::map({{"host", "a"}, {"port", 1}})}});
 * Node over = Node::map({{"db", Node::map({{"port", 2}})}});
 * deep_merge(base, over);   // {"db": {"host": "a", "port": 2}}
 *
 * Node over2 = Node::map({{"db", "string"}});
 * deep_merge(base, over2);  // {"db": "string"}
 * ```
 */
Node deep_merge(const Node& base, const Node& overlay);

/// Applies deep_merge() left to right; an empty list gives an empty map.
Node deep_merge_all(const std::vector<Node>& sources);

/**
 * @brief Merge @p input into @p base in place
 *
 * @throws SelectorSyntaxError, MergeInstructionError on a bad selector (base untouched)
 * @throws KeyError if a source key is missing from the input (base untouched)
 * @throws TypeMismatchError, DuplicateTargetError (base untouched)
 * @throws NoMatchError if options.require_match and nothing was applied
 */
MergeReport merge(Node& base, const Node& input, const std::string& selector,
                  const MergeOptions& options = {});

/**
 * @brief Merge two documents, returning the merged base
 *
 * Example:
 * ```cpp
 * auto result = merge(base_doc, input_doc,
 *                     "environment.preview.[].(name=allowedIps on value from Ips)");
 * if (result.report.unmatched > 0) { ... }
 * ```
 */
MergeResult merge(Document base, const Document& input, const std::string& selector,
                  const MergeOptions& options = {});

} // namespace graft

#endif // GRAFT_MERGE_HPP

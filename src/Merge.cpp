/**
 * @file Merge.cpp
 * @brief Implementation of deep merge and the merge operation
 */

#include "graft/Merge.hpp"
#include "graft/Errors.hpp"
#include "graft/Log.hpp"
#include "graft/Resolver.hpp"
#include "graft/Selector.hpp"

namespace graft {

Node deep_merge(const Node& base, const Node& overlay) {
    // Null doesn't override
    if (overlay.is_null()) {
        return base;
    }
    if (base.is_null()) {
        return overlay;
    }

    if (base.is_map() && overlay.is_map()) {
        Node result = base;
        Map& merged = result.as_map();
        const Map& over = overlay.as_map();
        for (std::size_t i = 0; i < over.size(); ++i) {
            const auto& key = over.key_at(i);
            if (Node* existing = merged.find(key)) {
                *existing = deep_merge(*existing, over.value_at(i));
            } else {
                merged.insert_or_assign(key, over.value_at(i));
            }
        }
        return result;
    }

    // Lists, scalars, and mixed kinds: overlay wins
    return overlay;
}

Node deep_merge_all(const std::vector<Node>& sources) {
    if (sources.empty()) {
        return Node::map();
    }

    Node result = sources[0];
    for (size_t i = 1; i < sources.size(); ++i) {
        result = deep_merge(result, sources[i]);
    }
    return result;
}

MergeReport merge(Node& base, const Node& input, const std::string& selector,
                  const MergeOptions& options) {
    const Selector parsed = parse_selector(selector);
    log_debug("selector: " + to_string(parsed));

    const MatchRange locations = resolve(base, parsed);
    if (log_enabled(LogLevel::Debug)) {
        for (const auto& location : locations) {
            log_debug("resolved " + to_string(location));
        }
    }

    const MergeReport report = parsed.instruction
        ? apply_instruction(base, locations, *parsed.instruction, input, options)
        : apply_overlay(base, locations, input);

    log_info("merge " + selector + ": locations=" + std::to_string(report.locations) +
             " applied=" + std::to_string(report.applied) +
             " unmatched=" + std::to_string(report.unmatched));
    if (report.locations == 0) {
        log_warn("selector '" + selector + "' matched nothing");
    }

    if (options.require_match && report.applied == 0) {
        throw NoMatchError(selector);
    }
    return report;
}

MergeResult merge(Document base, const Document& input, const std::string& selector,
                  const MergeOptions& options) {
    MergeResult result;
    result.report = merge(base.root, input.root, selector, options);
    result.document = std::move(base);
    return result;
}

} // namespace graft

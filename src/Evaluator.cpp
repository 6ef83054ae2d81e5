/**
 * @file Evaluator.cpp
 * @brief Implementation of merge instruction evaluation
 */

#include "graft/Evaluator.hpp"
#include "graft/DotPath.hpp"
#include "graft/Errors.hpp"
#include "graft/Log.hpp"
#include "graft/Merge.hpp"
#include "graft/Util.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace graft {

DuplicatePolicy parse_duplicate_policy(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "first") return DuplicatePolicy::First;
    if (lower == "all") return DuplicatePolicy::All;
    if (lower == "error") return DuplicatePolicy::Error;
    throw std::invalid_argument("Unknown duplicate policy '" + name +
                                "' (expected first, all or error)");
}

std::string to_string(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::First: return "first";
        case DuplicatePolicy::All: return "all";
        case DuplicatePolicy::Error: return "error";
    }
    return "first";
}

namespace {

// Non-throwing lookup: exact key first, then dot path.
const Node* lookup(const Node& node, const std::string& key) {
    if (!node.is_map()) {
        return nullptr;
    }
    if (const Node* exact = node.as_map().find(key)) {
        return exact;
    }
    const Node* current = &node;
    for (const auto& seg : split_dot_path(key)) {
        if (current->is_map()) {
            current = current->as_map().find(seg);
        } else if (const auto index = current->is_list() ? parse_list_index(seg)
                                                           : std::optional<std::size_t>{}) {
            const auto& items = current->as_list();
            current = *index < items.size() ? &items[*index] : nullptr;
        } else {
            current = nullptr;
        }
        if (!current) {
            return nullptr;
        }
    }
    return current == &node ? nullptr : current;
}

bool key_matches(const Node& element, const KeyedUpdate& update) {
    if (!element.is_map()) {
        return false;
    }
    const Node* key = element.as_map().find(update.key_field);
    return key && key->is_scalar() && key->scalar().to_string() == update.target_value;
}

void require_kind(const Node& node, NodeKind kind, const MatchLocation& location) {
    if (node.kind() != kind) {
        throw TypeMismatchError(to_string(location), kind == NodeKind::List ? "list" : "map",
                                kind_name(node));
    }
}

// ============================================================================
// Instruction visitors
// ============================================================================

class InstructionApplier {
public:
    InstructionApplier(Node& base, const MatchRange& locations, const Node& input,
                       const MergeOptions& options)
        : base_(base), locations_(locations), input_(input), options_(options) {}

    MergeReport operator()(const KeyedUpdate& update) const {
        const Node value = find_source(input_, update.source_key);

        // Phase 1: shapes and duplicates
        for (const auto& location : locations_) {
            const Node& target = locate(static_cast<const Node&>(base_), location);
            require_kind(target, NodeKind::List, location);
            if (options_.duplicates == DuplicatePolicy::Error) {
                std::size_t hits = 0;
                for (const auto& element : target.as_list()) {
                    hits += key_matches(element, update) ? 1 : 0;
                }
                if (hits > 1) {
                    throw DuplicateTargetError(to_string(location), update.key_field, update.target_value);
                }
            }
        }

        // Phase 2: writes
        MergeReport report;
        for (const auto& location : locations_) {
            ++report.locations;
            bool hit = false;
            for (auto& element : locate(base_, location).as_list()) {
                if (!key_matches(element, update)) {
                    continue;
                }
                element.as_map().insert_or_assign(update.value_field, value);
                log_debug("set " + to_string(location) + "[" + update.key_field + "=" +
                          update.target_value + "]." + update.value_field);
                hit = true;
                if (options_.duplicates != DuplicatePolicy::All) {
                    break;
                }
            }
            if (hit) {
                ++report.applied;
            } else {
                ++report.unmatched;
                log_debug("no element with " + update.key_field + "=" + update.target_value +
                          " at " + to_string(location));
            }
        }
        return report;
    }

    MergeReport operator()(const DirectAssign& assign) const {
        std::vector<std::pair<std::string, Node>> values;
        values.reserve(assign.fields.size());
        for (const auto& field : assign.fields) {
            values.emplace_back(field.dest_field, find_source(input_, field.source_key));
        }

        for (const auto& location : locations_) {
            require_kind(locate(static_cast<const Node&>(base_), location), NodeKind::Map, location);
        }

        MergeReport report;
        for (const auto& location : locations_) {
            ++report.locations;
            Map& target = locate(base_, location).as_map();
            for (const auto& [dest, value] : values) {
                target.insert_or_assign(dest, value);
                log_debug("set " + (location.is_root() ? dest : to_string(location) + "." + dest));
            }
            ++report.applied;
        }
        return report;
    }

private:
    Node& base_;
    const MatchRange& locations_;
    const Node& input_;
    const MergeOptions& options_;
};

} // anonymous namespace

const Node& find_source(const Node& input, const std::string& source_key) {
    if (const Node* found = lookup(input, source_key)) {
        return *found;
    }
    if (input.is_map()) {
        const Map& sections = input.as_map();
        for (std::size_t i = 0; i < sections.size(); ++i) {
            if (const Node* found = lookup(sections.value_at(i), source_key)) {
                log_debug("source '" + source_key + "' found in section '" + sections.key_at(i) + "'");
                return *found;
            }
        }
    }
    throw KeyError("input", source_key);
}

MergeReport apply_instruction(Node& base, const MatchRange& locations,
                              const MergeInstruction& instruction, const Node& input,
                              const MergeOptions& options) {
    return std::visit(InstructionApplier(base, locations, input, options), instruction);
}

MergeReport apply_overlay(Node& base, const MatchRange& locations, const Node& input) {
    if (!input.is_map()) {
        throw TypeMismatchError("input", "map", kind_name(input));
    }
    const Node overlay = input;

    for (const auto& location : locations) {
        require_kind(locate(static_cast<const Node&>(base), location), NodeKind::Map, location);
    }

    MergeReport report;
    for (const auto& location : locations) {
        ++report.locations;
        Node& target = locate(base, location);
        target = deep_merge(target, overlay);
        log_debug("merged input into " + to_string(location));
        ++report.applied;
    }
    return report;
}

} // namespace graft

#ifndef GRAFT_UTIL_HPP
#define GRAFT_UTIL_HPP

#include "graft/Value.hpp"

#include <map>
#include <string>
#include <vector>

namespace graft {

// String helpers
std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// The two halves of a --merge-with argument: "base_file@selector".
struct MergeSpec {
    std::string base_path;
    std::string selector;
};

// Splits at the first '@'. Throws std::invalid_argument when the '@' is
// missing or either half is empty.
MergeSpec parse_merge_spec(const std::string& spec);

// Parse "key=value" assignments (from --set). Values are typed with
// parse_value(); later assignments of the same key win.
// Throws std::invalid_argument for an entry without '=' or with an empty key.
std::map<std::string, Node> parse_overrides(const std::vector<std::string>& assignments);

} // namespace graft

#endif // GRAFT_UTIL_HPP

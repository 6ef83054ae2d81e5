#include "graft/Util.hpp"
#include "graft/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace graft {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

MergeSpec parse_merge_spec(const std::string& spec) {
    const auto at = spec.find('@');
    if (at == std::string::npos) {
        throw std::invalid_argument("Merge spec must be in format base_file@selector: " + spec);
    }
    MergeSpec out{spec.substr(0, at), spec.substr(at + 1)};
    if (out.base_path.empty()) {
        throw std::invalid_argument("Merge spec has no base file: " + spec);
    }
    if (out.selector.empty()) {
        throw std::invalid_argument("Merge spec has no selector: " + spec);
    }
    return out;
}

std::map<std::string, Node> parse_overrides(const std::vector<std::string>& assignments) {
    std::map<std::string, Node> out;
    for (const auto& entry : assignments) {
        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Override must be key=value: " + entry);
        }
        std::string key = trim(entry.substr(0, eq));
        if (key.empty()) {
            throw std::invalid_argument("Override has an empty key: " + entry);
        }
        out[key] = parse_value(trim(entry.substr(eq + 1)));
    }
    return out;
}

} // namespace graft

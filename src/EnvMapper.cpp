/**
 * @file EnvMapper.cpp
 * @brief Environment variable mapping implementation
 */

#include "graft/EnvMapper.hpp"
#include "graft/DotPath.hpp"
#include "graft/Log.hpp"
#include "graft/Parse.hpp"
#include "graft/Util.hpp"

#include <algorithm>
#include <cctype>

extern char** environ;

namespace graft {

namespace {

bool starts_with_icase(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), str.begin(),
                      [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) ==
                                 std::toupper(static_cast<unsigned char>(b));
                      });
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

std::string normalized_prefix(std::string prefix) {
    while (!prefix.empty() && prefix.back() == '_') {
        prefix.pop_back();
    }
    return prefix;
}

} // anonymous namespace

std::string transform_env_name(const std::string& name) {
    std::string result = to_lower(name);

    // Keep literal underscores (written "__") out of the way
    const std::string marker = "\x1F";
    result = replace_all(result, "__", marker);
    result = replace_all(result, "_", ".");
    return replace_all(result, marker, "_");
}

std::string strip_prefix(const std::string& var_name, const std::string& prefix) {
    const std::string normalized = normalized_prefix(prefix);
    if (normalized.empty()) {
        return var_name;
    }

    const std::string with_underscore = normalized + "_";
    if (starts_with_icase(var_name, with_underscore)) {
        return var_name.substr(with_underscore.length());
    }
    return "";
}

std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> result;
    const std::string match = normalized_prefix(prefix) + "_";
    if (match == "_" || environ == nullptr) {
        return result;
    }

    for (char** env = environ; *env != nullptr; ++env) {
        const std::string entry(*env);
        const size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string name = entry.substr(0, eq_pos);
        if (starts_with_icase(name, match)) {
            result.emplace_back(std::move(name), entry.substr(eq_pos + 1));
        }
    }
    return result;
}

std::set<std::string> flatten_keys(const Node& data, const std::string& prefix) {
    std::set<std::string> keys;
    if (!data.is_map()) {
        if (!prefix.empty()) {
            keys.insert(prefix);
        }
        return keys;
    }

    const Map& map = data.as_map();
    for (std::size_t i = 0; i < map.size(); ++i) {
        const std::string key = prefix.empty() ? map.key_at(i) : prefix + "." + map.key_at(i);
        keys.insert(key);
        if (map.value_at(i).is_map()) {
            auto nested = flatten_keys(map.value_at(i), key);
            keys.insert(nested.begin(), nested.end());
        }
    }
    return keys;
}

std::string remap_env_key(const std::string& dot_path, const std::set<std::string>& known_keys) {
    if (known_keys.count(dot_path) > 0) {
        return dot_path;
    }

    const auto segments = split_dot_path(dot_path);
    if (segments.size() < 2 || segments.size() > 16) {
        return "";
    }

    // Each bit of `joins` picks '_' or '.' for one gap between segments.
    const std::size_t gaps = segments.size() - 1;
    for (std::size_t joins = 1; joins < (std::size_t{1} << gaps); ++joins) {
        std::string candidate = segments[0];
        for (std::size_t i = 0; i < gaps; ++i) {
            candidate += (joins >> i) & 1U ? '_' : '.';
            candidate += segments[i + 1];
        }
        if (known_keys.count(candidate) > 0) {
            return candidate;
        }
    }
    return "";
}

std::vector<std::pair<std::string, Node>> map_env_vars(
    const std::vector<std::pair<std::string, std::string>>& env_vars,
    const std::string& prefix,
    const Node& known
) {
    const auto known_keys = flatten_keys(known);
    std::vector<std::pair<std::string, Node>> result;

    for (const auto& [name, value] : env_vars) {
        const std::string rest = strip_prefix(name, prefix);
        if (rest.empty()) {
            continue;
        }
        const std::string key = remap_env_key(transform_env_name(rest), known_keys);
        if (key.empty() || get_by_dot(known, key)->is_map()) {
            log_debug("ignoring environment variable " + name + ": no such setting");
            continue;
        }
        result.emplace_back(key, parse_value(value));
    }
    return result;
}

} // namespace graft

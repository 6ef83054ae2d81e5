#include "graft/Config.hpp"
#include "graft/DotPath.hpp"
#include "graft/EnvMapper.hpp"
#include "graft/Errors.hpp"
#include "graft/Json.hpp"
#include "graft/Loader.hpp"
#include "graft/Merge.hpp"

#include <stdexcept>

namespace graft {

Node Config::defaults() {
    return Node::map({
        {"output_format", ""},
        {"log_level", "warn"},
        {"merge", Node::map({{"duplicates", "first"}, {"strict", false}})},
        {"xml", Node::map({{"root", "root"}})},
    });
}

Config Config::load(const LoadOptions& opts) {
    Node merged = defaults();

    // 1) file
    if (opts.file_path.has_value()) {
        merged = deep_merge(merged, load_config_file(*opts.file_path));
    }

    Config cfg(merged);

    // 2) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 3) overrides
    cfg.apply_overrides(opts.overrides);

    cfg.validate();
    return cfg;
}

const Node& Config::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return contains_dot(data_, path);
}

void Config::set(const std::string& path, const Node& v) {
    set_by_dot(data_, path, v);
}

void Config::apply_env_prefix(const std::string& prefix) {
    for (const auto& [key, value] : map_env_vars(collect_env_vars(prefix), prefix, defaults())) {
        log_debug("setting " + key + " from environment");
        set(key, value);
    }
}

void Config::apply_overrides(const std::map<std::string, Node>& kv) {
    const Node known = defaults();
    for (const auto& [key, value] : kv) {
        if (!contains_dot(known, key) || get_by_dot(known, key)->is_map()) {
            throw std::invalid_argument("Unknown setting '" + key + "'");
        }
        set(key, value);
    }
}

void Config::validate() const {
    const auto require_string = [this](const std::string& key) -> const std::string& {
        const Node& v = at(key);
        if (!v.is_scalar() || !v.scalar().is_string()) {
            throw std::invalid_argument("Setting '" + key + "' must be a string, got " + kind_name(v));
        }
        return v.scalar().as_string();
    };

    parse_log_level(require_string("log_level"));
    parse_duplicate_policy(require_string("merge.duplicates"));
    require_string("output_format");
    if (require_string("xml.root").empty()) {
        throw std::invalid_argument("Setting 'xml.root' must not be empty");
    }
    const Node& strict = at("merge.strict");
    if (!strict.is_scalar() || !strict.scalar().is_boolean()) {
        throw std::invalid_argument("Setting 'merge.strict' must be true or false, got " +
                                    to_display_string(strict));
    }
}

std::string Config::output_format() const {
    return at("output_format").scalar().as_string();
}

LogLevel Config::log_level() const {
    return parse_log_level(at("log_level").scalar().as_string());
}

MergeOptions Config::merge_options() const {
    MergeOptions options;
    options.duplicates = parse_duplicate_policy(at("merge.duplicates").scalar().as_string());
    options.require_match = at("merge.strict").scalar().as_boolean();
    return options;
}

FormatOptions Config::format_options() const {
    FormatOptions options;
    options.xml_root = at("xml.root").scalar().as_string();
    return options;
}

std::string Config::to_json_string(int indent) const {
    return node_to_json(data_).dump(indent);
}

} // namespace graft

/**
 * @file Config.hpp
 * @brief Tool settings, layered from defaults to command line
 *
 * Precedence (lowest first): built-in defaults -> config file (JSON or
 * TOML) -> GRAFT_* environment variables -> overrides (--set and the
 * dedicated CLI flags).
 *
 * Keys:
 * | Key               | Default   | Meaning                               |
 * |-------------------|-----------|---------------------------------------|
 * | output_format     | ""        | output format; empty = input format   |
 * | log_level         | "warn"    | error, warn, info, debug              |
 * | merge.duplicates  | "first"   | first, all, error                     |
 * | merge.strict      | false     | fail when nothing was merged          |
 * | xml.root          | "root"    | document element for XML output       |
 */

#ifndef GRAFT_CONFIG_HPP
#define GRAFT_CONFIG_HPP

#include "graft/Evaluator.hpp"
#include "graft/Format.hpp"
#include "graft/Log.hpp"
#include "graft/Value.hpp"

#include <map>
#include <optional>
#include <string>

namespace graft {

struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix = std::string("GRAFT");  // nullopt disables the environment
    std::map<std::string, Node> overrides;                     // final precedence
};

class Config {
public:
    Config() : data_(defaults()) {}
    explicit Config(Node data) : data_(std::move(data)) {}

    /// The built-in defaults; also the list of known keys.
    static Node defaults();

    /**
     * @brief Load using the precedence: defaults -> file -> env -> overrides
     *
     * @throws FileNotFoundError if the named file doesn't exist
     * @throws FormatParseError if the file is malformed
     * @throws std::invalid_argument for an unknown override key or a bad value
     */
    static Config load(const LoadOptions& opts);

    const Node& data() const noexcept { return data_; }

    // Dot helpers
    const Node& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Node& v);

    // Typed views of the known keys
    std::string output_format() const;
    LogLevel log_level() const;
    MergeOptions merge_options() const;
    FormatOptions format_options() const;

    std::string to_json_string(int indent = 2) const;

    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Node>& kv);

private:
    /// @throws std::invalid_argument if a known key holds an unusable value
    void validate() const;

    Node data_;
};

} // namespace graft

#endif // GRAFT_CONFIG_HPP

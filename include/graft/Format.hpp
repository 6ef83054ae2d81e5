/**
 * @file Format.hpp
 * @brief Format collaborators: text <-> document tree
 *
 * Every supported serialization format turns its text into a Node tree
 * and back. The merge engine only sees trees; it never depends on the
 * syntax of a format.
 *
 * Supported formats: json, yaml, xml, toml, rune (record format).
 */

#ifndef GRAFT_FORMAT_HPP
#define GRAFT_FORMAT_HPP

#include "graft/Value.hpp"

#include <memory>
#include <string>
#include <vector>

namespace graft {

/**
 * @brief Parser/serializer pair for one format
 */
class Format {
public:
    virtual ~Format() = default;

    /// Canonical lowercase name, e.g. "yaml"
    virtual std::string name() const = 0;

    /// File extensions including the dot, e.g. {".yaml", ".yml"}
    virtual std::vector<std::string> extensions() const = 0;

    /**
     * @brief Parse text into a tree
     * @throws FormatParseError on malformed input
     */
    virtual Node parse(const std::string& text) const = 0;

    /// Serialize a tree to text
    virtual std::string serialize(const Node& root) const = 0;
};

/**
 * @brief Knobs for the format collaborators
 */
struct FormatOptions {
    /// Name of the XML document element written by serialize()
    std::string xml_root = "root";
    /// Indentation used by JSON and YAML output
    int indent = 2;
};

class JsonFormat : public Format {
public:
    explicit JsonFormat(int indent = 2) : indent_(indent) {}
    std::string name() const override { return "json"; }
    std::vector<std::string> extensions() const override { return {".json"}; }
    Node parse(const std::string& text) const override;
    std::string serialize(const Node& root) const override;

private:
    int indent_;
};

class YamlFormat : public Format {
public:
    explicit YamlFormat(int indent = 2) : indent_(indent) {}
    std::string name() const override { return "yaml"; }
    std::vector<std::string> extensions() const override { return {".yaml", ".yml"}; }
    Node parse(const std::string& text) const override;
    std::string serialize(const Node& root) const override;

private:
    int indent_;
};

/**
 * @brief XML mapping
 *
 * - the document element's content is the tree root
 * - child elements become map keys; repeated names become a list
 * - attributes become "@name" keys
 * - text-only elements become typed scalars, empty elements null
 * - text beside child elements is kept under "#text"
 */
class XmlFormat : public Format {
public:
    explicit XmlFormat(std::string root_name = "root") : root_name_(std::move(root_name)) {}
    std::string name() const override { return "xml"; }
    std::vector<std::string> extensions() const override { return {".xml"}; }
    Node parse(const std::string& text) const override;
    std::string serialize(const Node& root) const override;

private:
    std::string root_name_;
};

class TomlFormat : public Format {
public:
    std::string name() const override { return "toml"; }
    std::vector<std::string> extensions() const override { return {".toml"}; }
    Node parse(const std::string& text) const override;
    std::string serialize(const Node& root) const override;
};

/**
 * @brief Section-based record format
 *
 * ```
 * #!RUNE
 * @environment/preview
 * region = eu-west
 * allowedIps:
 *   - 10.0.0.1
 * + name = url
 *   value = preview.com
 * ```
 *
 * `@a/b` sections become nested maps, `key = value` entries typed
 * scalars, `key:` series lists, and `+` records a list under "record".
 */
class RuneFormat : public Format {
public:
    std::string name() const override { return "rune"; }
    std::vector<std::string> extensions() const override { return {".rune"}; }
    Node parse(const std::string& text) const override;
    std::string serialize(const Node& root) const override;
};

/**
 * @brief Create the collaborator for a format name (case-insensitive)
 * @throws UnsupportedFormatError for unknown names
 */
std::unique_ptr<Format> make_format(const std::string& name, const FormatOptions& options = {});

/**
 * @brief Format name for a file path, by extension
 * @return The matching name, or @p fallback when no format claims the extension
 */
std::string format_name_for_path(const std::string& path, const std::string& fallback = "rune");

/// Names accepted by make_format(), sorted.
std::vector<std::string> format_names();

} // namespace graft

#endif // GRAFT_FORMAT_HPP

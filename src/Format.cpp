/**
 * @file Format.cpp
 * @brief Format lookup by name and file extension
 */

#include "graft/Format.hpp"
#include "graft/Errors.hpp"
#include "graft/Util.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace graft {

std::unique_ptr<Format> make_format(const std::string& name, const FormatOptions& options) {
    const std::string lower = to_lower(name);
    if (lower == "json") return std::make_unique<JsonFormat>(options.indent);
    if (lower == "yaml" || lower == "yml") return std::make_unique<YamlFormat>(options.indent);
    if (lower == "xml") return std::make_unique<XmlFormat>(options.xml_root);
    if (lower == "toml") return std::make_unique<TomlFormat>();
    if (lower == "rune") return std::make_unique<RuneFormat>();
    throw UnsupportedFormatError(name);
}

std::vector<std::string> format_names() {
    return {"json", "rune", "toml", "xml", "yaml"};
}

std::string format_name_for_path(const std::string& path, const std::string& fallback) {
    const std::string ext = to_lower(fs::path(path).extension().string());
    if (ext.empty()) {
        return fallback;
    }
    for (const auto& name : format_names()) {
        const auto exts = make_format(name)->extensions();
        if (std::find(exts.begin(), exts.end(), ext) != exts.end()) {
            return name;
        }
    }
    return fallback;
}

} // namespace graft

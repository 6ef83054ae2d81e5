/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "graft/Loader.hpp"
#include "graft/Errors.hpp"
#include "graft/Log.hpp"
#include "graft/Util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace graft {

// ============================================================================
// Files
// ============================================================================

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    return read_stream(file);
}

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw GraftError("Cannot open '" + path + "' for writing");
    }
    file << content;
    if (!file) {
        throw GraftError("Failed to write '" + path + "'");
    }
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

// ============================================================================
// Documents
// ============================================================================

Document parse_document(const std::string& text, const std::string& format,
                        const FormatOptions& options) {
    const auto collaborator = make_format(format, options);
    return Document{collaborator->parse(text), collaborator->name()};
}

Document load_document(const std::string& path, const std::string& format,
                       const FormatOptions& options) {
    const std::string name = format.empty() ? format_name_for_path(path) : format;
    log_debug("loading " + (path == "-" ? std::string("<stdin>") : path) + " as " + name);

    if (path == "-") {
        return parse_document(read_stream(std::cin), name, options);
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), name, options);
}

std::string serialize_document(const Document& doc, const std::string& format,
                               const FormatOptions& options) {
    const std::string name = format.empty() ? doc.format : format;
    return make_format(name, options)->serialize(doc.root);
}

// ============================================================================
// Tool configuration
// ============================================================================

Node load_config_file(const std::string& path) {
    if (path.empty()) {
        return Node::map();
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext != ".json" && ext != ".toml") {
        throw UnsupportedFormatError(ext.empty() ? path : ext);
    }

    const auto format = make_format(ext.substr(1));
    try {
        return format->parse(read_file(path));
    } catch (const FormatParseError& e) {
        throw FormatParseError(e.format(), path + ": " + e.details());
    }
}

} // namespace graft

/**
 * @file Loader.hpp
 * @brief Reading and writing documents and tool-config files
 *
 * Documents are read with the format named explicitly or, failing
 * that, the one claiming the file extension (rune when none does).
 * The path "-" means standard input/output.
 */

#ifndef GRAFT_LOADER_HPP
#define GRAFT_LOADER_HPP

#include "graft/Format.hpp"
#include "graft/Merge.hpp"
#include "graft/Value.hpp"

#include <iosfwd>
#include <string>

namespace graft {

// ============================================================================
// Files
// ============================================================================

/// @return true if @p path names an existing regular file
bool file_exists(const std::string& path);

/**
 * @brief Read a whole file
 * @throws FileNotFoundError if it cannot be opened
 */
std::string read_file(const std::string& path);

/// Read a whole stream.
std::string read_stream(std::istream& in);

/**
 * @brief Replace the contents of a file
 * @throws GraftError if it cannot be written
 */
void write_file(const std::string& path, const std::string& content);

/// Lowercase extension including the dot, or empty.
std::string get_file_extension(const std::string& path);

// ============================================================================
// Documents
// ============================================================================

/**
 * @brief Parse text as a document of a given format
 * @throws UnsupportedFormatError, FormatParseError
 */
Document parse_document(const std::string& text, const std::string& format,
                        const FormatOptions& options = {});

/**
 * @brief Load a document from a file ("-" reads stdin)
 *
 * @param path File to read
 * @param format Format name; empty means "detect by extension"
 * @throws FileNotFoundError, UnsupportedFormatError, FormatParseError
 */
Document load_document(const std::string& path, const std::string& format = "",
                       const FormatOptions& options = {});

/**
 * @brief Serialize a document in @p format (its own format when empty)
 */
std::string serialize_document(const Document& doc, const std::string& format = "",
                               const FormatOptions& options = {});

// ============================================================================
// Tool configuration
// ============================================================================

/**
 * @brief Load a configuration file, detecting its format by extension
 *
 * - empty path -> empty map (no file loaded)
 * - .json -> JSON, .toml -> TOML
 *
 * @throws FileNotFoundError if path is non-empty and the file doesn't exist
 * @throws FormatParseError on syntax errors
 * @throws UnsupportedFormatError for any other extension
 */
Node load_config_file(const std::string& path);

} // namespace graft

#endif // GRAFT_LOADER_HPP

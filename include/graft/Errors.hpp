/**
 * @file Errors.hpp
 * @brief Exception types for graft
 *
 * Error taxonomy:
 * - GraftError: Base class
 * - SelectorSyntaxError: Malformed selector text (carries position)
 * - MergeInstructionError: Incomplete merge instruction inside a selector
 * - TypeMismatchError: A node has the wrong shape for an operation
 * - KeyError: A path segment or source key does not exist
 * - DuplicateTargetError: Several list elements match a keyed update
 * - NoMatchError: A strict merge applied nothing
 * - FileNotFoundError: Document or config file not found
 * - FormatParseError: A format collaborator rejected its input
 * - UnsupportedFormatError: Unknown format name or extension
 */

#ifndef GRAFT_ERRORS_HPP
#define GRAFT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace graft {

/**
 * @brief Base class for all graft exceptions
 */
class GraftError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Selector text does not follow the selector grammar
 *
 * Raised by parse_selector before any resolution is attempted.
 */
class SelectorSyntaxError : public GraftError {
public:
    /**
     * @brief Construct with the selector and error location
     * @param selector Full selector text
     * @param position Zero-based byte offset of the offending fragment
     * @param fragment The offending fragment (may be empty at end of input)
     * @param reason What was expected or found
     */
    SelectorSyntaxError(std::string selector, std::size_t position,
                        std::string fragment, std::string reason)
        : GraftError(format_message(selector, position, fragment, reason))
        , selector_(std::move(selector))
        , position_(position)
        , fragment_(std::move(fragment))
        , reason_(std::move(reason))
    {}

    const std::string& selector() const noexcept { return selector_; }
    std::size_t position() const noexcept { return position_; }
    const std::string& fragment() const noexcept { return fragment_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string selector_;
    std::size_t position_;
    std::string fragment_;
    std::string reason_;

    static std::string format_message(const std::string& selector, std::size_t position,
                                      const std::string& fragment, const std::string& reason) {
        std::string msg = "Invalid selector '" + selector + "' at position " +
                          std::to_string(position);
        if (!fragment.empty()) {
            msg += " near '" + fragment + "'";
        }
        return msg + ": " + reason;
    }
};

/**
 * @brief Merge instruction is well-formed at the character level but
 *        semantically incomplete (missing 'on'/'from', missing operands)
 */
class MergeInstructionError : public SelectorSyntaxError {
public:
    using SelectorSyntaxError::SelectorSyntaxError;
};

/**
 * @brief A node has a different shape than an operation requires
 */
class TypeMismatchError : public GraftError {
public:
    /**
     * @param location Where the mismatch happened (selector location or dot-path)
     * @param expected Required kind (e.g., "list")
     * @param actual Kind encountered (e.g., "string")
     */
    TypeMismatchError(std::string location, std::string expected, std::string actual)
        : GraftError("Type mismatch at '" + location + "': expected " + expected +
                     ", found " + actual)
        , location_(std::move(location))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& location() const noexcept { return location_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string location_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Key or index not found while following a path
 */
class KeyError : public GraftError {
public:
    /**
     * @param path Full path being accessed (e.g., "database.host")
     * @param segment The specific segment that doesn't exist (e.g., "host")
     */
    KeyError(std::string path, std::string segment)
        : GraftError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief More than one list element matched a keyed update while the
 *        duplicate policy forbids it
 */
class DuplicateTargetError : public GraftError {
public:
    DuplicateTargetError(std::string location, std::string key_field, std::string target)
        : GraftError("Several elements at '" + location + "' have " + key_field +
                     "=" + target)
        , location_(std::move(location))
        , key_field_(std::move(key_field))
        , target_(std::move(target))
    {}

    const std::string& location() const noexcept { return location_; }
    const std::string& key_field() const noexcept { return key_field_; }
    const std::string& target() const noexcept { return target_; }

private:
    std::string location_;
    std::string key_field_;
    std::string target_;
};

/**
 * @brief A merge that requires a match applied nothing
 */
class NoMatchError : public GraftError {
public:
    explicit NoMatchError(std::string selector)
        : GraftError("Selector '" + selector + "' did not change the base document")
        , selector_(std::move(selector))
    {}

    const std::string& selector() const noexcept { return selector_; }

private:
    std::string selector_;
};

/**
 * @brief Document or configuration file not found
 */
class FileNotFoundError : public GraftError {
public:
    explicit FileNotFoundError(std::string path)
        : GraftError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A format collaborator could not parse its input
 */
class FormatParseError : public GraftError {
public:
    /**
     * @param format Format name (e.g., "yaml")
     * @param details Detailed error message from the parser
     */
    FormatParseError(std::string format, std::string details)
        : GraftError("Failed to parse " + format + ": " + details)
        , format_(std::move(format))
        , details_(std::move(details))
    {}

    const std::string& format() const noexcept { return format_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string format_;
    std::string details_;
};

/**
 * @brief No format is registered under a name or file extension
 */
class UnsupportedFormatError : public GraftError {
public:
    explicit UnsupportedFormatError(std::string name)
        : GraftError("Unsupported format: " + name)
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace graft

#endif // GRAFT_ERRORS_HPP

/**
 * @file Command.hpp
 * @brief The work behind the graft command line, minus argument parsing
 */

#ifndef GRAFT_COMMAND_HPP
#define GRAFT_COMMAND_HPP

#include "graft/Config.hpp"
#include "graft/Evaluator.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace graft {

struct CommandOptions {
    std::string input = "-";                ///< input document, "-" for stdin
    std::string input_format;               ///< empty = by extension
    std::optional<std::string> merge_with;  ///< "BASE@SELECTOR"
    std::string output_file;                ///< empty = @p out stream
    bool report = false;                    ///< print the merge counts to @p err
};

/**
 * @brief Load, optionally merge, and write
 *
 * Without merge_with the input is converted to the output format.
 * With it, the input is merged into the base and the base is written,
 * by default in the base's own format.
 *
 * @return The merge counts (all zero when converting)
 * @throws GraftError subclasses and std::invalid_argument on any failure;
 *         nothing is written then
 */
MergeReport run_command(const CommandOptions& options, const Config& config,
                        std::ostream& out, std::ostream& err);

} // namespace graft

#endif // GRAFT_COMMAND_HPP

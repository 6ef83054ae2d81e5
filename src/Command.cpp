/**
 * @file Command.cpp
 * @brief Implementation of the command-line workflow
 */

#include "graft/Command.hpp"
#include "graft/Loader.hpp"
#include "graft/Log.hpp"
#include "graft/Merge.hpp"
#include "graft/Util.hpp"

#include <ostream>

namespace graft {

MergeReport run_command(const CommandOptions& options, const Config& config,
                        std::ostream& out, std::ostream& err) {
    const FormatOptions format_options = config.format_options();
    Document input = load_document(options.input, options.input_format, format_options);

    MergeReport report;
    Document result;
    if (options.merge_with) {
        const MergeSpec spec = parse_merge_spec(*options.merge_with);
        Document base = load_document(spec.base_path, "", format_options);
        MergeResult merged = merge(std::move(base), input, spec.selector, config.merge_options());
        report = merged.report;
        result = std::move(merged.document);
    } else {
        result = std::move(input);
    }

    const std::string text = serialize_document(result, config.output_format(), format_options);
    if (options.output_file.empty()) {
        out << text;
    } else {
        write_file(options.output_file, text);
        log_info("wrote " + options.output_file);
    }

    if (options.report) {
        err << "locations=" << report.locations << " applied=" << report.applied
            << " unmatched=" << report.unmatched << "\n";
    }
    return report;
}

} // namespace graft

#pragma once

#include "jsonedit++/common_types.h"
#include "jsonedit++/edit_pipeline.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace jsonedit {
namespace cli {

// Configuration of one jsonedit invocation
struct CommandLineOptions {
    OutputOptions output;
    ParseOptions input;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> arguments; // Positional: none, "!document", file, or file1 file2
};

/**
 * Parses the arguments following the program name. Edit options (--set, --remove, --insert) are
 * registered with `pipeline` in command line order.
 * @throws CommandLineException for unknown options, missing option arguments or too many positional arguments.
 * @throws JsonParsingException, FileAccessException if an option value cannot be loaded.
 */
CommandLineOptions parse_command_line(const std::vector<std::string>& args, EditPipeline& pipeline);

// As above; a "-" value is read from `standard_input` instead of std::cin.
CommandLineOptions parse_command_line(const std::vector<std::string>& args, EditPipeline& pipeline,
                                      std::istream& standard_input);

// A JSON literal, "@file-name" for a document read from a file, or "-" for one read from
// `standard_input` (std::cin by default). Comments are skipped in all three.
json load_value_argument(const std::string& argument, std::istream& standard_input);
json load_value_argument(const std::string& argument);

/**
 * Transforms the input selected by options.arguments: `in` to `out` when there are no positional
 * arguments, the literal of "!document" to `out`, one file in place, or the first file into the second.
 */
void run(const CommandLineOptions& options, const EditPipeline& pipeline, std::istream& in, std::ostream& out);

// The output file is written through a temporary sibling that does not exist yet, then renamed.
void transform_file(const EditPipeline& pipeline, const std::string& in_file, const std::string& out_file,
                    const OutputOptions& output, const ParseOptions& input = {});

void print_usage(std::ostream& out);

} // namespace cli
} // namespace jsonedit

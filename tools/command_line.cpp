#include "command_line.h"
#include "jsonedit++/document_io.h"
#include "jsonedit++/exceptions.h"
#include "jsonedit++/logging.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept> // For std::invalid_argument, std::out_of_range
#include <system_error>

namespace jsonedit {
namespace cli {

namespace {

// Cursor over the argument list with option-argument checks
class ArgumentReader {
public:
    explicit ArgumentReader(const std::vector<std::string>& args) : args_(args) {}

    bool has_next() const { return position_ < args_.size(); }
    const std::string& peek() const { return args_[position_]; }
    const std::string& next() { return args_[position_++]; }

    const std::string& next_operand(const std::string& option, const char* operand_name) {
        if (!has_next()) {
            throw CommandLineException("Option " + option + " requires argument <" + operand_name + ">");
        }
        return next();
    }

private:
    const std::vector<std::string>& args_;
    std::size_t position_ = 0;
};

int parse_indent(const std::string& text) {
    try {
        size_t chars_processed = 0;
        int indent = std::stoi(text, &chars_processed);
        if (chars_processed != text.length() || indent < 0) {
            throw CommandLineException("Invalid indentation: " + text);
        }
        return indent;
    } catch (const std::invalid_argument&) {
        throw CommandLineException("Invalid indentation (not a number): " + text);
    } catch (const std::out_of_range&) {
        throw CommandLineException("Indentation out of range: " + text);
    }
}

std::string read_file(const std::string& file_name) {
    std::ifstream file(file_name, std::ios::binary);
    if (!file.is_open()) {
        throw FileAccessException(file_name, "cannot open for reading");
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw FileAccessException(file_name, "read failed");
    }
    return contents.str();
}

// First of "<file>.tmp", "<file>.tmp1", ... that does not exist yet
std::string unused_temp_name(const std::string& file_name) {
    std::string temp_name = file_name + ".tmp";
    for (int suffix = 1; std::filesystem::exists(temp_name); ++suffix) {
        temp_name = file_name + ".tmp" + std::to_string(suffix);
    }
    return temp_name;
}

// Writes through a sibling temporary file so that an existing file is replaced atomically.
void write_file(const std::string& file_name, const std::string& contents) {
    const std::string temp_name = unused_temp_name(file_name);
    {
        std::ofstream file(temp_name, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw FileAccessException(temp_name, "cannot open for writing");
        }
        file << contents;
        file.close();
        if (file.fail()) {
            std::error_code ignored;
            std::filesystem::remove(temp_name, ignored);
            throw FileAccessException(temp_name, "write failed");
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_name, file_name, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_name, ignored);
        throw FileAccessException(file_name, "cannot replace file: " + ec.message());
    }
}

} // namespace

json load_value_argument(const std::string& argument, std::istream& standard_input) {
    if (argument == "-") {
        return parse_document(standard_input, ParseOptions{true});
    }
    if (!argument.empty() && argument.front() == '@') {
        const std::string file_name = argument.substr(1);
        return parse_document(read_file(file_name), ParseOptions{true});
    }
    return parse_document(argument, ParseOptions{true});
}

json load_value_argument(const std::string& argument) {
    return load_value_argument(argument, std::cin);
}

CommandLineOptions parse_command_line(const std::vector<std::string>& args, EditPipeline& pipeline) {
    return parse_command_line(args, pipeline, std::cin);
}

CommandLineOptions parse_command_line(const std::vector<std::string>& args, EditPipeline& pipeline,
                                      std::istream& standard_input) {
    CommandLineOptions options;
    ArgumentReader reader(args);
    bool reads_standard_input = false;

    auto load_value = [&](const std::string& argument) {
        if (argument == "-") {
            if (reads_standard_input) {
                throw CommandLineException("The standard input can supply only one value");
            }
            reads_standard_input = true;
        }
        return load_value_argument(argument, standard_input);
    };

    while (reader.has_next()) {
        const std::string& arg = reader.peek();
        if (arg == "--") {
            reader.next();
            break;
        }
        if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            break; // First positional argument
        }
        const std::string option = reader.next();

        if (option == "--help") {
            options.help = true;
        } else if (option == "--pretty-printing") {
            options.output.pretty_printing = true;
        } else if (option == "--indent") {
            options.output.indent = parse_indent(reader.next_operand(option, "width"));
        } else if (option == "--lenient") {
            options.input.lenient = true;
        } else if (option == "--verbose") {
            options.verbose = true;
        } else if (option == "--set") {
            SetMode mode = SetMode::ANY;
            while (reader.has_next() && (reader.peek() == "--existing" || reader.peek() == "--non-existing")) {
                mode = reader.next() == "--existing" ? SetMode::EXISTING : SetMode::NON_EXISTING;
            }
            const std::string spec = reader.next_operand(option, "spec");
            const std::string& value = reader.next_operand(option, "json-document-or-file");
            pipeline.add_set(spec, load_value(value), mode);
        } else if (option == "--remove") {
            RemoveMode mode = RemoveMode::ANY;
            if (reader.has_next() && reader.peek() == "--existing") {
                reader.next();
                mode = RemoveMode::EXISTING;
            }
            pipeline.add_remove(reader.next_operand(option, "spec"), mode);
        } else if (option == "--insert") {
            const std::string spec = reader.next_operand(option, "spec");
            const std::string& value = reader.next_operand(option, "json-document-or-file");
            pipeline.add_insert(spec, load_value(value));
        } else {
            throw CommandLineException("Unknown option " + option);
        }
    }

    while (reader.has_next()) {
        options.arguments.push_back(reader.next());
    }
    if (options.arguments.size() > 2) {
        throw CommandLineException("Too many arguments; expected at most an input and an output file");
    }
    if (reads_standard_input && options.arguments.empty()) {
        throw CommandLineException("The standard input cannot supply both a value and the document");
    }
    return options;
}

void transform_file(const EditPipeline& pipeline, const std::string& in_file, const std::string& out_file,
                    const OutputOptions& output, const ParseOptions& input) {
    logger()->debug("Transforming '{}' into '{}'", in_file, out_file);
    std::istringstream in(read_file(in_file));
    std::ostringstream out;
    pipeline.transform(in, out, output, input);
    write_file(out_file, out.str());
}

void run(const CommandLineOptions& options, const EditPipeline& pipeline, std::istream& in, std::ostream& out) {
    const auto& arguments = options.arguments;

    if (arguments.empty()) {
        pipeline.transform(in, out, options.output, options.input);
        out << '\n';
    } else if (arguments.size() == 1 && !arguments[0].empty() && arguments[0].front() == '!') {
        std::istringstream document(arguments[0].substr(1));
        pipeline.transform(document, out, options.output, options.input);
        out << '\n';
    } else if (arguments.size() == 1) {
        transform_file(pipeline, arguments[0], arguments[0], options.output, options.input);
    } else {
        transform_file(pipeline, arguments[0], arguments[1], options.output, options.input);
    }
}

void print_usage(std::ostream& out) {
    out << "Usage:\n"
           "  jsonedit [option ...]                     Read a JSON document from STDIN, modify it, print it to STDOUT.\n"
           "  jsonedit [option ...] !<json-document>    Modify the literal document and print it to STDOUT.\n"
           "  jsonedit [option ...] <file>              Modify <file> in place.\n"
           "  jsonedit [option ...] <file1> <file2>     Modify the document in <file1> and write it to <file2>.\n"
           "\n"
           "Options:\n"
           "  --help                                    Print this text and exit.\n"
           "  --pretty-printing                         Wrap and indent objects and arrays.\n"
           "  --indent <width>                          Indentation for --pretty-printing (default 2).\n"
           "  --lenient                                 Allow comments in the input document.\n"
           "  --verbose                                 Log each applied operation.\n"
           "  --set [--existing|--non-existing] <spec> <json-document-or-file>\n"
           "                                            Add or change one array element or object member.\n"
           "  --remove [--existing] <spec>              Remove one array element or object member.\n"
           "  --insert <spec> <json-document-or-file>   Insert an element into an array.\n"
           "\n"
           "Specs:\n"
           "  (empty)                 The entire document (--set only).\n"
           "  <path>.<member-name>    An object member; member names match [A-Za-z0-9_]+.\n"
           "  <path>[]                One past the last array element (append).\n"
           "  <path>[<index>]         An array element; negative indices count from the end.\n"
           "\n"
           "A <json-document-or-file> is a JSON literal, @<file-name>, or \"-\" for the standard input.\n"
           "Comments are allowed in values; \"-\" requires the document to come from a file or !<json-document>.\n";
}

} // namespace cli
} // namespace jsonedit

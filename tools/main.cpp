#include "command_line.h"
#include "jsonedit++/edit_pipeline.h"
#include "jsonedit++/exceptions.h"
#include "jsonedit++/logging.h"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace jsonedit;

    const std::vector<std::string> args(argv + 1, argv + argc);
    EditPipeline pipeline;
    cli::CommandLineOptions options;

    try {
        options = cli::parse_command_line(args, pipeline);
    } catch (const JsonEditException& e) {
        logger()->error("{}", describe_exception(e));
        std::cerr << "Try 'jsonedit --help'." << std::endl;
        return 2;
    }

    if (options.help) {
        cli::print_usage(std::cout);
        return 0;
    }
    if (options.verbose) {
        set_log_level(spdlog::level::debug);
    }
    logger()->debug("{} operation(s) configured", pipeline.size());

    try {
        cli::run(options, pipeline, std::cin, std::cout);
    } catch (const std::exception& e) {
        logger()->error("{}", describe_exception(e));
        return 1;
    }
    return 0;
}

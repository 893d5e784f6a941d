#include "arg_options.hpp"
#include "commands.hpp"

#include <iostream>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[])
{
    using namespace Ballot::Tools;

    auto options = parse_argv(argc, argv);

    if (options.show_help || !options.valid) {
        if (!options.valid && options.error_message) {
            std::cerr << "Error: " << *options.error_message << "\n\n";
        }
        std::cout << options.help_text;
        return options.valid ? kExitOk : kExitUsage;
    }

    auto level = spdlog::level::from_str(options.log_level);
    if (level == spdlog::level::off && options.log_level != "off") {
        std::cerr << "Error: unknown log level " << options.log_level << "\n";
        return kExitUsage;
    }
    spdlog::set_level(level);

    return run_command(options, std::cin, std::cout, std::cerr);
}

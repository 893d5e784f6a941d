#pragma once

#include <optional>
#include <string>

namespace Ballot::Tools {

enum class Command {
    None,
    Commit,
    Root,
    Prove,
    Verify
};

// Parsed form of the ballot-tree command line.
struct CommandLineOptions {
    Command command = Command::None;

    std::optional<std::string> identity;
    std::optional<std::string> choice;
    std::optional<std::string> salt; // 为空时使用时间戳盐

    std::optional<std::string> leaves_file;
    std::optional<std::string> leaf;
    std::optional<std::string> proof_file;

    std::string log_level = "warn";

    bool show_help = false;
    bool valid = true;
    std::optional<std::string> error_message;
    std::string help_text;
};

CommandLineOptions parse_argv(int argc, char* argv[]);

} // namespace Ballot::Tools

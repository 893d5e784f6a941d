#include "arg_options.hpp"

#include <boost/program_options.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace Ballot::Tools {

namespace {

    std::optional<Command> parse_command(const std::string& name)
    {
        if (name == "commit")
            return Command::Commit;
        if (name == "root")
            return Command::Root;
        if (name == "prove")
            return Command::Prove;
        if (name == "verify")
            return Command::Verify;
        return std::nullopt;
    }

    std::optional<std::string> get(const po::variables_map& vm, const char* key)
    {
        if (vm.count(key)) {
            return vm[key].as<std::string>();
        }
        return std::nullopt;
    }

    const char* missing_option(const CommandLineOptions& o)
    {
        switch (o.command) {
        case Command::Commit:
            if (!o.identity)
                return "commit requires --identity";
            if (!o.choice)
                return "commit requires --choice";
            break;
        case Command::Root:
            if (!o.leaves_file)
                return "root requires --leaves";
            break;
        case Command::Prove:
            if (!o.leaves_file)
                return "prove requires --leaves";
            if (!o.leaf)
                return "prove requires --leaf";
            break;
        case Command::Verify:
            if (!o.proof_file)
                return "verify requires --proof";
            break;
        case Command::None:
            return "no command given";
        }
        return nullptr;
    }

} // namespace

CommandLineOptions parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Display this help message")
        ("identity", po::value<std::string>(), "Secret identity (commit)")
        ("choice", po::value<std::string>(), "Vote choice (commit)")
        ("salt", po::value<std::string>(), "Salt (commit); defaults to the current time in milliseconds")
        ("leaves", po::value<std::string>(), "File with one commitment per line (root, prove)")
        ("leaf", po::value<std::string>(), "Commitment to prove (prove)")
        ("proof", po::value<std::string>(), "Proof JSON file, '-' for stdin (verify)")
        ("log-level", po::value<std::string>()->default_value("warn"),
            "trace|debug|info|warn|error|critical|off");

    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>(), "Subcommand");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description pos_desc;
    pos_desc.add("command", 1);

    std::ostringstream help_stream;
    help_stream
        << "Usage: " << (argc > 0 ? argv[0] : "ballot-tree") << " <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  commit   Print the commitment and nullifier for an identity and choice\n"
        << "  root     Print the root and leaf count of the tree built from --leaves\n"
        << "  prove    Print the inclusion proof of --leaf as JSON\n"
        << "  verify   Check a proof JSON file; exit 0 if valid, 1 if not, 2 if malformed\n"
        << "\n"
        << desc;
    options.help_text = help_stream.str();

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos_desc).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            options.show_help = true;
            return options;
        }

        if (auto name = get(vm, "command")) {
            auto command = parse_command(*name);
            if (!command) {
                options.valid = false;
                options.error_message = "Unknown command: " + *name;
                return options;
            }
            options.command = *command;
        }

        options.identity = get(vm, "identity");
        options.choice = get(vm, "choice");
        options.salt = get(vm, "salt");
        options.leaves_file = get(vm, "leaves");
        options.leaf = get(vm, "leaf");
        options.proof_file = get(vm, "proof");
        options.log_level = vm["log-level"].as<std::string>();

        if (const char* missing = missing_option(options)) {
            options.valid = false;
            options.error_message = missing;
        }
    } catch (const po::error& e) {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

} // namespace Ballot::Tools

#include "commands.hpp"

#include "crypto/commitment.hpp"
#include "crypto/logging.hpp"
#include "crypto/proof_codec.hpp"

#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace Ballot::Tools {
using Crypto::CommitmentTree::Leaf;
using Crypto::CommitmentTree::Tree;

namespace {

    auto read_text(const std::string& path, std::istream& in) -> std::expected<std::string, std::string>
    {
        if (path == "-") {
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
        std::ifstream file(path);
        if (!file) {
            return std::unexpected("cannot open " + path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    auto load_tree(const std::string& path) -> std::expected<Tree, std::string>
    {
        auto leaves = read_leaves(path);
        if (!leaves) {
            return std::unexpected(leaves.error());
        }
        Logging::get("ballot-tree")->info("loaded {} leaves from {}", leaves->size(), path);
        return Tree::from_leaves(*leaves);
    }

} // namespace

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::vector<Leaf> parse_leaves(std::istream& in)
{
    std::vector<Leaf> leaves;
    std::string line;
    while (std::getline(in, line)) {
        auto value = trim(line);
        if (value.empty() || value.front() == '#') {
            continue;
        }
        leaves.push_back(std::move(value));
    }
    return leaves;
}

auto read_leaves(const std::string& path) -> std::expected<std::vector<Leaf>, std::string>
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected("cannot open " + path);
    }

    auto leaves = parse_leaves(in);
    if (in.bad()) {
        return std::unexpected("read error on " + path);
    }
    return leaves;
}

int run_commit(const CommandLineOptions& o, std::ostream& out)
{
    auto salt = o.salt.value_or(Crypto::Commitment::default_salt());
    out << "commitment " << Crypto::Commitment::commit(*o.identity, *o.choice, salt) << "\n"
        << "nullifier  " << Crypto::Commitment::nullifier(*o.identity) << "\n"
        << "salt       " << salt << "\n";
    return kExitOk;
}

int run_root(const CommandLineOptions& o, std::ostream& out, std::ostream& err)
{
    auto tree = load_tree(*o.leaves_file);
    if (!tree) {
        err << "Error: " << tree.error() << "\n";
        return kExitUsage;
    }
    out << "root   " << tree->root().value_or("<empty>") << "\n"
        << "leaves " << tree->leaf_count() << "\n";
    return kExitOk;
}

int run_prove(const CommandLineOptions& o, std::ostream& out, std::ostream& err)
{
    auto tree = load_tree(*o.leaves_file);
    if (!tree) {
        err << "Error: " << tree.error() << "\n";
        return kExitUsage;
    }
    auto proof = tree->prove(*o.leaf);
    if (!proof) {
        err << "Cannot prove membership: " << proof.error().message() << "\n";
        return kExitRejected;
    }
    out << Crypto::CommitmentTree::encode(*proof, 2) << "\n";
    return kExitOk;
}

int run_verify(const CommandLineOptions& o, std::istream& in, std::ostream& out, std::ostream& err)
{
    auto text = read_text(*o.proof_file, in);
    if (!text) {
        err << "Error: " << text.error() << "\n";
        return kExitUsage;
    }
    auto proof = Crypto::CommitmentTree::decode(*text);
    if (!proof) {
        err << "Error: " << proof.error().message() << "\n";
        return kExitUsage;
    }

    try {
        bool ok = Crypto::CommitmentTree::verify(*proof);
        out << (ok ? "valid" : "invalid") << "\n";
        return ok ? kExitOk : kExitRejected;
    } catch (const std::invalid_argument& e) {
        err << "Error: malformed proof: " << e.what() << "\n";
        return kExitUsage;
    }
}

int run_command(const CommandLineOptions& o, std::istream& in, std::ostream& out, std::ostream& err)
{
    switch (o.command) {
    case Command::Commit:
        return run_commit(o, out);
    case Command::Root:
        return run_root(o, out, err);
    case Command::Prove:
        return run_prove(o, out, err);
    case Command::Verify:
        return run_verify(o, in, out, err);
    case Command::None:
        break;
    }
    out << o.help_text;
    return kExitUsage;
}

} // namespace Ballot::Tools

#pragma once

#include "arg_options.hpp"

#include "crypto/commitment_tree.hpp"

#include <expected>
#include <iosfwd>
#include <string>
#include <vector>

namespace Ballot::Tools {

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

std::string trim(const std::string& s);

// 每行一个承诺；去掉首尾空白，空行和以 # 开头的行被忽略
std::vector<Crypto::CommitmentTree::Leaf> parse_leaves(std::istream& in);

auto read_leaves(const std::string& path)
    -> std::expected<std::vector<Crypto::CommitmentTree::Leaf>, std::string>;

// Subcommand bodies. Results go to `out`, diagnostics to `err`; `in` backs
// `--proof -`. Each returns the process exit code.
int run_commit(const CommandLineOptions& o, std::ostream& out);
int run_root(const CommandLineOptions& o, std::ostream& out, std::ostream& err);
int run_prove(const CommandLineOptions& o, std::ostream& out, std::ostream& err);
int run_verify(const CommandLineOptions& o, std::istream& in, std::ostream& out, std::ostream& err);

int run_command(const CommandLineOptions& o, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace Ballot::Tools

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include "crypto/common.hpp"

namespace Ballot::Crypto::CommitmentTree {

// 叶子本身就是承诺摘要，不再做一次叶子哈希
using Leaf = HexDigest;

// Side of the sibling relative to the running hash during verification.
enum class Side : std::uint8_t {
    Left,
    Right
};

[[nodiscard]] std::string_view to_string(Side side) noexcept;

struct PathStep {
    HexDigest hash;
    Side position;

    bool operator==(const PathStep&) const = default;
};

struct Proof {
    Leaf leaf;
    std::vector<PathStep> path; // 从叶子层到根
    HexDigest root;

    bool operator==(const Proof&) const = default;
};

enum class Pairing : std::uint8_t {
    Leaf, // 叶子层，无子节点
    Pair, // children are 2i and 2i+1 one level down
    PairedWithSelf // odd-length level: child 2i hashed with itself
};

struct Node {
    HexDigest hash;
    Pairing pairing;
};

// levels()[0] 是叶子层，levels().back() 只有根节点
using Level = std::vector<Node>;

// Reported after every insert/remove, including no-ops.
struct MutationResult {
    bool changed;
    std::optional<HexDigest> root;
    std::size_t leaf_count;
};

// Ordered leaf sequence plus the hash levels derived from it. Every mutation
// rebuilds all levels; the new levels are built before any member changes.
// Not synchronized: one mutation at a time, no reads during a mutation.
class Tree {
public:
    Tree() = default;

    // Seeds from persisted history; repeated values keep their first position
    // and empty values are skipped.
    [[nodiscard]]
    static Tree from_leaves(std::span<const Leaf> leaves);

    // An empty leaf is never stored; the result reports changed == false.
    MutationResult insert(const Leaf& leaf);
    MutationResult remove(const Leaf& leaf);

    [[nodiscard]] std::optional<HexDigest> root() const;

    // 返回副本，调用方无法借此修改内部状态
    [[nodiscard]] std::vector<Leaf> leaves() const { return leaves_; }
    [[nodiscard]] std::size_t leaf_count() const noexcept { return leaves_.size(); }
    [[nodiscard]] bool empty() const noexcept { return leaves_.empty(); }

    [[nodiscard]] bool contains(std::string_view leaf) const;
    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view leaf) const;

    [[nodiscard]] const std::vector<Level>& levels() const noexcept { return levels_; }

    // Error::EmptyTree / Error::LeafNotFound when no proof can be produced.
    [[nodiscard]]
    std::expected<Proof, std::error_code> prove(std::string_view leaf) const;

private:
    MutationResult replace_leaves(std::vector<Leaf>&& leaves);
    [[nodiscard]] MutationResult result(bool changed) const;

    std::vector<Leaf> leaves_;
    std::vector<Level> levels_;
};

// Needs only the proof. Returns false for a proof that does not fold to its
// root; throws std::invalid_argument for one that is structurally malformed
// (empty leaf, root or step hash, or a position outside Left/Right).
[[nodiscard]]
bool verify(const Proof& proof);

namespace detail {
    std::vector<Level> build_levels(std::span<const Leaf> leaves);
}

} // namespace Ballot::Crypto::CommitmentTree

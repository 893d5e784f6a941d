#include "crypto/commitment_tree.hpp"
#include "crypto/commitment.hpp"
#include "crypto/error.hpp"
#include "crypto/logging.hpp"

#include <algorithm>
#include <bit>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace Ballot::Crypto::CommitmentTree {
using Commitment::parent_hash;

namespace {

    spdlog::logger& logger()
    {
        static const auto instance = Logging::get("tree");
        return *instance;
    }

} // namespace

std::string_view to_string(Side side) noexcept
{
    switch (side) {
    case Side::Left:
        return "left";
    case Side::Right:
        return "right";
    }
    return "unknown";
}

namespace detail {

    std::vector<Level> build_levels(std::span<const Leaf> leaves)
    {
        std::vector<Level> levels;
        if (leaves.empty()) {
            return levels;
        }

        // 层数 = ceil(log2(N)) + 1，bit_width(N) + 1 足够
        levels.reserve(static_cast<std::size_t>(std::bit_width(leaves.size())) + 1);

        Level base;
        base.reserve(leaves.size());
        for (const auto& leaf : leaves) {
            base.push_back({ .hash = leaf, .pairing = Pairing::Leaf });
        }
        levels.push_back(std::move(base));

        while (levels.back().size() > 1) {
            const Level& below = levels.back();

            Level above;
            above.reserve((below.size() + 1) / 2);

            for (std::size_t i = 0; i < below.size(); i += 2) {
                if (i + 1 < below.size()) {
                    above.push_back({ .hash = parent_hash(below[i].hash, below[i + 1].hash),
                        .pairing = Pairing::Pair });
                } else {
                    // 奇数层: 末尾节点与自身配对，而不是原样上提
                    above.push_back({ .hash = parent_hash(below[i].hash, below[i].hash),
                        .pairing = Pairing::PairedWithSelf });
                }
            }

            levels.push_back(std::move(above));
        }

        return levels;
    }

} // namespace detail

// --- Tree 成员函数实现 ---

Tree Tree::from_leaves(std::span<const Leaf> leaves)
{
    std::vector<Leaf> unique;
    unique.reserve(leaves.size());

    std::unordered_set<std::string_view> seen;
    seen.reserve(leaves.size());
    std::size_t empty = 0;
    for (const auto& leaf : leaves) {
        if (leaf.empty()) {
            ++empty;
        } else if (seen.insert(leaf).second) {
            unique.push_back(leaf);
        }
    }

    if (empty != 0) {
        logger().warn("dropped {} empty leaves while seeding", empty);
    }
    if (unique.size() + empty != leaves.size()) {
        logger().debug("dropped {} repeated leaves while seeding", leaves.size() - empty - unique.size());
    }

    Tree tree;
    tree.replace_leaves(std::move(unique));
    return tree;
}

MutationResult Tree::insert(const Leaf& leaf)
{
    // 空串不是合法的承诺，verify 也会拒绝它
    if (leaf.empty()) {
        logger().warn("insert rejected: empty leaf");
        return result(false);
    }
    if (contains(leaf)) {
        logger().debug("insert {}: already present", Logging::abbrev(leaf));
        return result(false);
    }

    std::vector<Leaf> next = leaves_;
    next.push_back(leaf);
    return replace_leaves(std::move(next));
}

MutationResult Tree::remove(const Leaf& leaf)
{
    auto idx = index_of(leaf);
    if (!idx) {
        logger().debug("remove {}: not present", Logging::abbrev(leaf));
        return result(false);
    }

    std::vector<Leaf> next = leaves_;
    next.erase(next.begin() + static_cast<std::ptrdiff_t>(*idx));
    return replace_leaves(std::move(next));
}

MutationResult Tree::replace_leaves(std::vector<Leaf>&& leaves)
{
    // 先在旁边构建完整的新层，失败时旧状态不受影响
    auto levels = detail::build_levels(leaves);

    leaves_ = std::move(leaves);
    levels_ = std::move(levels);

    logger().trace("rebuilt tree: {} leaves, {} levels, root {}",
        leaves_.size(), levels_.size(),
        levels_.empty() ? std::string_view("<empty>") : Logging::abbrev(levels_.back().front().hash));

    return result(true);
}

MutationResult Tree::result(bool changed) const
{
    return MutationResult {
        .changed = changed,
        .root = root(),
        .leaf_count = leaves_.size()
    };
}

std::optional<HexDigest> Tree::root() const
{
    if (levels_.empty()) {
        return std::nullopt;
    }
    return levels_.back().front().hash;
}

bool Tree::contains(std::string_view leaf) const
{
    return index_of(leaf).has_value();
}

std::optional<std::size_t> Tree::index_of(std::string_view leaf) const
{
    auto it = std::find(leaves_.begin(), leaves_.end(), leaf);
    if (it == leaves_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - leaves_.begin());
}

std::expected<Proof, std::error_code> Tree::prove(std::string_view leaf) const
{
    if (leaves_.empty()) {
        return std::unexpected(make_error_code(Error::EmptyTree));
    }

    auto leaf_index = index_of(leaf);
    if (!leaf_index) {
        return std::unexpected(make_error_code(Error::LeafNotFound));
    }

    std::vector<PathStep> path;
    path.reserve(levels_.size() - 1);

    // 从叶子层向上，每层记录与当前节点配对的兄弟
    std::size_t t = *leaf_index;
    for (std::size_t k = 0; k + 1 < levels_.size(); ++k) {
        const Level& level = levels_[k];
        const Node& parent = levels_[k + 1][t >> 1];

        if (parent.pairing == Pairing::PairedWithSelf) {
            // 自配对: 兄弟就是自己，折叠时得到 H(x || x)
            path.push_back({ .hash = level[t].hash, .position = Side::Right });
        } else if (t & 1) {
            path.push_back({ .hash = level[t - 1].hash, .position = Side::Left });
        } else {
            path.push_back({ .hash = level[t + 1].hash, .position = Side::Right });
        }
        t >>= 1;
    }

    logger().debug("proof for {}: {} steps", Logging::abbrev(leaf), path.size());

    return Proof {
        .leaf = std::string(leaf),
        .path = std::move(path),
        .root = levels_.back().front().hash
    };
}

// --- 非成员函数实现 ---

bool verify(const Proof& proof)
{
    if (proof.leaf.empty()) {
        throw std::invalid_argument("proof has an empty leaf");
    }
    if (proof.root.empty()) {
        throw std::invalid_argument("proof has an empty root");
    }

    HexDigest acc = proof.leaf;

    for (std::size_t i = 0; i < proof.path.size(); ++i) {
        const auto& step = proof.path[i];
        if (step.hash.empty()) {
            throw std::invalid_argument("proof step " + std::to_string(i) + " has an empty hash");
        }

        switch (step.position) {
        case Side::Left:
            // 兄弟在左: H(sib || acc)
            acc = parent_hash(step.hash, acc);
            break;
        case Side::Right:
            // 兄弟在右: H(acc || sib)
            acc = parent_hash(acc, step.hash);
            break;
        default:
            throw std::invalid_argument("proof step " + std::to_string(i) + " has an unknown position");
        }
    }

    return acc == proof.root;
}

} // namespace Ballot::Crypto::CommitmentTree

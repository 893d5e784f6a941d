#include "core/ledger/commitment_ledger.hpp"
#include "core/error.hpp"
#include "crypto/logging.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace Ballot::Voting {
using Crypto::CommitmentTree::Leaf;
using Logging::abbrev;

namespace {

    MutationResult unchanged(const Tree& tree)
    {
        return MutationResult {
            .changed = false,
            .root = tree.root(),
            .leaf_count = tree.leaf_count()
        };
    }

    MutationResult changed(const Tree& tree)
    {
        return MutationResult {
            .changed = true,
            .root = tree.root(),
            .leaf_count = tree.leaf_count()
        };
    }

    std::string root_text(const Tree& tree)
    {
        return std::string(abbrev(tree.root().value_or("<empty>")));
    }

} // namespace

CommitmentLedger::CommitmentLedger(LedgerConfig config)
    : config_(std::move(config))
    , log_(Logging::get(config_.name))
    , state_(std::make_shared<State>())
{
}

std::shared_ptr<const CommitmentLedger::State> CommitmentLedger::load() const
{
    std::lock_guard lock(publish_mutex_);
    return state_;
}

void CommitmentLedger::publish(std::shared_ptr<const State> next)
{
    std::lock_guard lock(publish_mutex_);
    state_ = std::move(next);
}

auto CommitmentLedger::restore(std::span<const FinalizedEntry> history)
    -> std::expected<MutationResult, std::error_code>
{
    std::lock_guard lock(write_mutex_);

    auto next = std::make_shared<State>();
    std::vector<Leaf> leaves;
    leaves.reserve(history.size());

    // 与逐条调用 finalize 的语义一致: 后出现的条目覆盖同一 nullifier 的旧承诺
    for (const auto& entry : history) {
        if (entry.nullifier.empty() || entry.commitment.empty()) {
            log_->warn("restore rejected: empty field in history");
            return std::unexpected(make_error_code(Error::InvalidCommitment));
        }

        auto owner = next->by_commitment.find(entry.commitment);
        if (owner != next->by_commitment.end()) {
            if (owner->second == entry.nullifier) {
                continue;
            }
            log_->warn("restore rejected: commitment {} finalized twice", abbrev(entry.commitment));
            return std::unexpected(make_error_code(Error::CommitmentInUse));
        }

        auto prev = next->by_nullifier.find(entry.nullifier);
        if (prev != next->by_nullifier.end()) {
            leaves.erase(std::find(leaves.begin(), leaves.end(), prev->second));
            next->by_commitment.erase(prev->second);
            prev->second = entry.commitment;
        } else {
            if (config_.max_leaves != 0 && next->by_nullifier.size() >= config_.max_leaves) {
                log_->warn("restore rejected: history exceeds {} participants", config_.max_leaves);
                return std::unexpected(make_error_code(Error::LeafLimitReached));
            }
            next->by_nullifier.emplace(entry.nullifier, entry.commitment);
        }

        next->by_commitment.emplace(entry.commitment, entry.nullifier);
        leaves.push_back(entry.commitment);
    }

    next->tree = Tree::from_leaves(leaves);
    auto res = changed(next->tree);

    log_->info("restored {} entries: {} participants, root {}",
        history.size(), next->tree.leaf_count(), root_text(next->tree));

    publish(std::move(next));
    return res;
}

auto CommitmentLedger::finalize(const Nullifier& nullifier, const CommitmentHash& commitment)
    -> std::expected<MutationResult, std::error_code>
{
    if (nullifier.empty() || commitment.empty()) {
        log_->warn("finalize rejected: empty nullifier or commitment");
        return std::unexpected(make_error_code(Error::InvalidCommitment));
    }

    std::lock_guard lock(write_mutex_);
    auto current = load();

    auto owner = current->by_commitment.find(commitment);
    if (owner != current->by_commitment.end()) {
        if (owner->second == nullifier) {
            log_->debug("finalize {}: already final", abbrev(commitment));
            return unchanged(current->tree);
        }
        log_->warn("finalize rejected: commitment {} belongs to another participant", abbrev(commitment));
        return std::unexpected(make_error_code(Error::CommitmentInUse));
    }

    auto prev = current->by_nullifier.find(nullifier);
    const bool is_update = prev != current->by_nullifier.end();

    if (!is_update && config_.max_leaves != 0 && current->tree.leaf_count() >= config_.max_leaves) {
        log_->warn("finalize rejected: ledger holds {} participants", config_.max_leaves);
        return std::unexpected(make_error_code(Error::LeafLimitReached));
    }

    auto next = std::make_shared<State>();
    next->by_nullifier = current->by_nullifier;
    next->by_commitment = current->by_commitment;

    if (is_update) {
        // 投票更新: 删除旧叶子，新叶子追加到末尾，只重建一次
        std::vector<Leaf> leaves = current->tree.leaves();
        leaves.erase(std::find(leaves.begin(), leaves.end(), prev->second));
        leaves.push_back(commitment);
        next->tree = Tree::from_leaves(leaves);

        next->by_commitment.erase(prev->second);
    } else {
        next->tree = current->tree;
        next->tree.insert(commitment);
    }

    next->by_nullifier[nullifier] = commitment;
    next->by_commitment[commitment] = nullifier;

    auto res = changed(next->tree);
    log_->info("{} {}: {} participants, root {}",
        is_update ? "updated" : "finalized", abbrev(commitment),
        next->tree.leaf_count(), root_text(next->tree));

    publish(std::move(next));
    return res;
}

auto CommitmentLedger::withdraw(const Nullifier& nullifier)
    -> std::expected<MutationResult, std::error_code>
{
    std::lock_guard lock(write_mutex_);
    auto current = load();

    auto prev = current->by_nullifier.find(nullifier);
    if (prev == current->by_nullifier.end()) {
        log_->warn("withdraw rejected: unknown nullifier {}", abbrev(nullifier));
        return std::unexpected(make_error_code(Error::UnknownNullifier));
    }

    auto next = std::make_shared<State>(*current);
    next->tree.remove(prev->second);
    next->by_commitment.erase(prev->second);
    next->by_nullifier.erase(nullifier);

    auto res = changed(next->tree);
    log_->info("withdrew {}: {} participants, root {}",
        abbrev(prev->second), next->tree.leaf_count(), root_text(next->tree));

    publish(std::move(next));
    return res;
}

auto CommitmentLedger::prove(const Nullifier& nullifier) const
    -> std::expected<Proof, std::error_code>
{
    auto current = load();

    auto it = current->by_nullifier.find(nullifier);
    if (it == current->by_nullifier.end()) {
        return std::unexpected(make_error_code(Error::UnknownNullifier));
    }
    return current->tree.prove(it->second);
}

std::optional<CommitmentHash> CommitmentLedger::commitment_of(const Nullifier& nullifier) const
{
    auto current = load();

    auto it = current->by_nullifier.find(nullifier);
    if (it == current->by_nullifier.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t CommitmentLedger::participant_count() const
{
    return load()->by_nullifier.size();
}

std::vector<FinalizedEntry> CommitmentLedger::entries() const
{
    auto current = load();

    std::vector<FinalizedEntry> out;
    out.reserve(current->tree.leaf_count());
    for (const auto& leaf : current->tree.leaves()) {
        out.push_back({ .nullifier = current->by_commitment.at(leaf), .commitment = leaf });
    }
    return out;
}

std::shared_ptr<const Tree> CommitmentLedger::snapshot() const
{
    auto current = load();
    // aliasing: 与整个 State 共享所有权
    return std::shared_ptr<const Tree>(current, &current->tree);
}

} // namespace Ballot::Voting

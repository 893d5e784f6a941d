#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "core/common.hpp"
#include "crypto/commitment_tree.hpp"

namespace Ballot::Voting {

using Crypto::CommitmentTree::MutationResult;
using Crypto::CommitmentTree::Proof;
using Crypto::CommitmentTree::Tree;

// Owns the commitment tree together with the nullifier -> finalized commitment
// mapping. Each participant has at most one leaf; finalizing again replaces
// the old leaf (vote update).
//
// Mutations are serialized and build the next state off to the side before
// publishing it. Readers work on the published state and never observe a
// rebuild in progress; a snapshot stays valid after later mutations.
class CommitmentLedger {
public:
    explicit CommitmentLedger(LedgerConfig config = {});

    CommitmentLedger(const CommitmentLedger&) = delete;
    CommitmentLedger& operator=(const CommitmentLedger&) = delete;

    // Replaces the current state by replaying persisted finalizations in
    // order. On error nothing is published.
    [[nodiscard]]
    auto restore(std::span<const FinalizedEntry> history)
        -> std::expected<MutationResult, std::error_code>;

    [[nodiscard]]
    auto finalize(const Nullifier& nullifier, const CommitmentHash& commitment)
        -> std::expected<MutationResult, std::error_code>;

    [[nodiscard]]
    auto withdraw(const Nullifier& nullifier)
        -> std::expected<MutationResult, std::error_code>;

    // Proof for the participant's current commitment against the current root.
    [[nodiscard]]
    auto prove(const Nullifier& nullifier) const
        -> std::expected<Proof, std::error_code>;

    [[nodiscard]] std::optional<CommitmentHash> commitment_of(const Nullifier& nullifier) const;
    [[nodiscard]] std::size_t participant_count() const;

    // Finalizations in leaf order; restore(entries()) reproduces the tree.
    [[nodiscard]] std::vector<FinalizedEntry> entries() const;

    [[nodiscard]] std::shared_ptr<const Tree> snapshot() const;

    [[nodiscard]] const LedgerConfig& config() const noexcept { return config_; }

private:
    struct State {
        Tree tree;
        std::unordered_map<Nullifier, CommitmentHash> by_nullifier;
        std::unordered_map<CommitmentHash, Nullifier> by_commitment;
    };

    [[nodiscard]] std::shared_ptr<const State> load() const;
    void publish(std::shared_ptr<const State> next);

    LedgerConfig config_;
    std::shared_ptr<spdlog::logger> log_;

    std::mutex write_mutex_; // 同一时刻最多一个变更
    mutable std::mutex publish_mutex_; // 只保护 state_ 指针本身
    std::shared_ptr<const State> state_;
};

} // namespace Ballot::Voting

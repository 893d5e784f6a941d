#pragma once

#include <cstddef>
#include <string>

#include "crypto/common.hpp"

namespace Ballot::Voting {

/// Digest of "nullifier:" + secret identity; one per participant
using Nullifier = Crypto::HexDigest;

/// Finalized commitment; becomes a tree leaf
using CommitmentHash = Crypto::HexDigest;

/// Ledger configuration
struct LedgerConfig {
    std::string name = "ledger"; ///< Logger name and log prefix
    std::size_t max_leaves = 0; ///< Participant cap, 0 for unlimited
};

/// One persisted finalization, in history order
struct FinalizedEntry {
    Nullifier nullifier;
    CommitmentHash commitment;
};

} // namespace Ballot::Voting

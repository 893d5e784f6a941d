#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Ballot::Voting {
enum class Error : std::uint8_t {
    Success = 0,
    CommitmentInUse, // 承诺已被另一个参与者最终确认
    UnknownNullifier, // 该 nullifier 没有已确认的承诺
    LeafLimitReached, // 超出 max_leaves
    InvalidCommitment // 空承诺或空 nullifier
};

class VotingErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "BallotVoting"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::CommitmentInUse:
            return "Commitment is already finalized by another participant";
        case Error::UnknownNullifier:
            return "No finalized commitment for this nullifier";
        case Error::LeafLimitReached:
            return "Ledger participant limit reached";
        case Error::InvalidCommitment:
            return "Nullifier and commitment must be non-empty";
        default:
            return "Unknown voting error";
        }
    }
};

inline const std::error_category& voting_category()
{
    static VotingErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), voting_category() };
}
} // namespace Ballot::Voting

namespace std {
template <>
struct is_error_code_enum<Ballot::Voting::Error> : true_type { };
} // namespace std

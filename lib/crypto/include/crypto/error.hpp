#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Ballot::Crypto {
enum class Error : std::uint8_t {
    Success = 0,
    EmptyTree, // 树中没有叶子
    LeafNotFound, // 请求证明的叶子不在当前序列中
    MalformedProof, // 证明结构缺字段或字段类型错误
    DigestFailure // OpenSSL 摘要原语失败，不可恢复
};

class CryptoErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "BallotCrypto"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyTree:
            return "Commitment tree has no leaves";
        case Error::LeafNotFound:
            return "Leaf is not present in the commitment tree";
        case Error::MalformedProof:
            return "Inclusion proof is structurally malformed";
        case Error::DigestFailure:
            return "Digest primitive failure";
        default:
            return "Unknown crypto error";
        }
    }
};

inline const std::error_category& crypto_category()
{
    static CryptoErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), crypto_category() };
}
} // namespace Ballot::Crypto

namespace std {
template <>
struct is_error_code_enum<Ballot::Crypto::Error> : true_type { };
} // namespace std

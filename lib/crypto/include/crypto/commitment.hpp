#pragma once

#include <string>
#include <string_view>

#include "crypto/common.hpp"

namespace Ballot::Crypto::Commitment {

// 防重复参与: H("nullifier:" || identity)，与选项无关
[[nodiscard]]
HexDigest nullifier(std::string_view secret_identity);

// H(identity || ":" || choice || ":" || salt)
[[nodiscard]]
HexDigest commit(std::string_view secret_identity, std::string_view choice, std::string_view salt);

// Uses default_salt(). Two calls within the same millisecond collide, and the
// salt is guessable; callers that need unlinkability must pass their own.
[[nodiscard]]
HexDigest commit(std::string_view secret_identity, std::string_view choice);

// Milliseconds since the Unix epoch, in decimal.
[[nodiscard]]
std::string default_salt();

// H(left || right)，无分隔符，顺序敏感
[[nodiscard]]
HexDigest parent_hash(std::string_view left, std::string_view right);

} // namespace Ballot::Crypto::Commitment

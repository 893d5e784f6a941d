#pragma once

#include <string_view>

#include "crypto/common.hpp"

namespace Ballot::Crypto::Digest {

// SHA-256 over arbitrary bytes. A failing OpenSSL primitive throws
// std::system_error(Error::DigestFailure); nothing downstream recovers from it.
[[nodiscard]] Hash256 sha256(BytesSpan data);

// Lowercase hex, two characters per byte.
[[nodiscard]] HexDigest to_hex(BytesSpan data);

[[nodiscard]] HexDigest sha256_hex(std::string_view text);

} // namespace Ballot::Crypto::Digest

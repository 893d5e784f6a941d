#include "crypto/digest.hpp"
#include "crypto/error.hpp"
#include "crypto/logging.hpp"
#include "impl/evp.hpp"

#include <openssl/evp.h>
#include <system_error>

namespace Ballot::Crypto::Digest {
using Crypto::impl::EvpMdCtxPtr;

namespace {

    [[noreturn]] void digest_failure(const char* step)
    {
        Logging::get("crypto")->critical("SHA-256 primitive failed at {}", step);
        throw std::system_error(make_error_code(Error::DigestFailure), step);
    }

} // namespace

Hash256 sha256(BytesSpan data)
{
    Hash256 h;
    unsigned int len = 0;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        digest_failure("EVP_MD_CTX_new");
    }

    if (1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        digest_failure("EVP_DigestInit_ex");
    }

    if (1 != EVP_DigestUpdate(ctx.get(), u8ptr(data), data.size())) {
        digest_failure("EVP_DigestUpdate");
    }

    if (1 != EVP_DigestFinal_ex(ctx.get(), u8ptr(h.data()), &len) || len != h.size()) {
        digest_failure("EVP_DigestFinal_ex");
    }

    return h;
}

HexDigest to_hex(BytesSpan data)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    HexDigest out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0f]);
    }
    return out;
}

HexDigest sha256_hex(std::string_view text)
{
    return to_hex(sha256(as_span(text)));
}

} // namespace Ballot::Crypto::Digest

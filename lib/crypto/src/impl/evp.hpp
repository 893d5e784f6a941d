#pragma once

#include <memory>
#include <openssl/evp.h>

namespace Ballot::Crypto::impl {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
    decltype([](EVP_MD_CTX* ctx) {
        EVP_MD_CTX_free(ctx);
    })>;

} // namespace Ballot::Crypto::impl

#include "crypto/commitment.hpp"
#include "crypto/digest.hpp"

#include <chrono>
#include <string>

namespace Ballot::Crypto::Commitment {

namespace {

    constexpr std::string_view NULLIFIER_PREFIX { "nullifier:" };
    constexpr char FIELD_SEPARATOR { ':' };

} // namespace

HexDigest nullifier(std::string_view secret_identity)
{
    std::string msg;
    msg.reserve(NULLIFIER_PREFIX.size() + secret_identity.size());
    msg.append(NULLIFIER_PREFIX);
    msg.append(secret_identity);
    return Digest::sha256_hex(msg);
}

HexDigest commit(std::string_view secret_identity, std::string_view choice, std::string_view salt)
{
    std::string msg;
    msg.reserve(secret_identity.size() + choice.size() + salt.size() + 2);
    msg.append(secret_identity);
    msg.push_back(FIELD_SEPARATOR);
    msg.append(choice);
    msg.push_back(FIELD_SEPARATOR);
    msg.append(salt);
    return Digest::sha256_hex(msg);
}

HexDigest commit(std::string_view secret_identity, std::string_view choice)
{
    return commit(secret_identity, choice, default_salt());
}

std::string default_salt()
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return std::to_string(ms);
}

HexDigest parent_hash(std::string_view left, std::string_view right)
{
    std::string buf;
    buf.reserve(left.size() + right.size());
    buf.append(left);
    buf.append(right);
    return Digest::sha256_hex(buf);
}

} // namespace Ballot::Crypto::Commitment

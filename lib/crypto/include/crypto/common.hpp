#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Ballot::Crypto {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;

// SHA-256 原始输出
using Hash256 = std::array<Byte, 32>;

// 十六进制编码后的摘要，叶子和根都以这种形式流转
using HexDigest = std::string;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

inline const unsigned char* u8ptr(const Byte* p)
{
    return reinterpret_cast<const unsigned char*>(p);
}

inline unsigned char* u8ptr(Byte* p)
{
    return reinterpret_cast<unsigned char*>(p);
}

inline const unsigned char* u8ptr(BytesSpan s)
{
    return u8ptr(s.data());
}

} // namespace Ballot::Crypto

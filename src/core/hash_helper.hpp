#pragma once

#include <string>

#include "serialize.h"
#include "span.h"
#include "uint256.h"
#include "crypto/sha256.h"

namespace ordguard {

// Serialization sink that feeds a hasher (CSHA256 or compatible)
template <typename H>
class HashWriter
{
    H m_hasher;
public:
    explicit HashWriter(const H& hasher) : m_hasher(hasher) {}

    void write(Span<const std::byte> src)
    { m_hasher.Write(reinterpret_cast<const unsigned char *>(src.data()), src.size()); }

    template <typename T>
    HashWriter& operator<<(const T& obj)
    {
        ::Serialize(*this, obj);
        return *this;
    }

    uint256 GetHash()
    {
        uint256 result;
        m_hasher.Finalize(result.begin());
        return result;
    }
};

inline CSHA256 PrecalculatedTaggedHash(const std::string &tag) noexcept
{
    uint256 taghash;
    CSHA256().Write((const unsigned char*)tag.data(), tag.size()).Finalize(taghash.data());
    return CSHA256().Write(taghash.data(), uint256::size()).Write(taghash.data(), uint256::size());
}

extern const CSHA256 TAPLEAF_HASH;
extern const CSHA256 TAPBRANCH_HASH;
extern const CSHA256 TAPTWEAK_HASH;

}

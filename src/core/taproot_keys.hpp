#pragma once

#include <optional>
#include <string>
#include <utility>

#include "secp256k1.h"
#include "secp256k1_extrakeys.h"

#include "uint256.h"

#include "common.hpp"
#include "common_error.hpp"

namespace ordguard::core {

// Public side of a participant key: accepts either a 33-byte compressed key or a 32-byte x-only key
class TaprootKeys
{
    const secp256k1_context* m_ctx;
    std::optional<compressed_pubkey> m_compressed_pk;
    xonly_pubkey m_pk;

public:
    static secp256k1_context* GetStaticSecp256k1Context();

    explicit TaprootKeys(const std::string& pubkey_hex);
    explicit TaprootKeys(const xonly_pubkey& pk);

    TaprootKeys(const TaprootKeys&) = default;
    TaprootKeys(TaprootKeys&&) noexcept = default;

    TaprootKeys& operator=(const TaprootKeys&) = default;
    TaprootKeys& operator=(TaprootKeys&&) noexcept = default;

    const secp256k1_context* Secp256k1Context() const noexcept
    { return m_ctx; }

    const xonly_pubkey& GetPubKey() const
    { return m_pk; }

    bool HasCompressedPubKey() const
    { return m_compressed_pk.has_value(); }

    // Throws KeyError for an x-only key source
    const compressed_pubkey& GetCompressedPubKey() const;

    static std::pair<xonly_pubkey, uint8_t> AddTapTweak(const xonly_pubkey& pk, const std::optional<uint256>& merkle_root);

    std::pair<xonly_pubkey, uint8_t> AddTapTweak(const std::optional<uint256>& merkle_root) const
    { return AddTapTweak(m_pk, merkle_root); }
};

}

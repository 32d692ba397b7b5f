#pragma once

#include <string>

#include "univalue.h"
#include "uint256.h"
#include "primitives/transaction.h"

#include "address.hpp"
#include "common.hpp"

namespace ordguard::protection {

struct CommitmentAddress
{
    std::string address;
    CScript script_pubkey;
    xonly_pubkey internal_key;
    uint256 merkle_root;
};

struct EscrowAddress
{
    std::string address;
    std::string merkle_root;
};

// Taproot address over a key-spend leaf and an inscription envelope carrying JSON metadata
class CommitmentAddressBuilder
{
    core::AddressCoder m_coder;
public:
    static const std::string name_buyer_pk;
    static const std::string name_buyer_address;
    static const std::string name_unique_id;
    static const std::string name_inscription_outpoint;

    CommitmentAddressBuilder(core::Network network, core::Chain chain) : m_coder(network, chain) {}

    const core::AddressCoder& Coder() const noexcept
    { return m_coder; }

    CommitmentAddress Build(const std::string& pubkey_hex, const UniValue& payload) const;

    CommitmentAddress BuildBuyerAddress(const std::string& buyer_pk, const std::string& buyer_address, const std::string& unique_id) const;
    CommitmentAddress BuildEscrowAddress(const COutPoint& inscription_outpoint, const std::string& escrow_pk) const;
};

// Deterministic: same inputs always give the same address
EscrowAddress GetEscrowAddress(const std::string& inscription_outpoint, const std::string& escrow_pk, core::Network network, core::Chain chain);

}

#pragma once

#include <string>

#include "script/script.h"

#include "common.hpp"

namespace ordguard::core {

enum class Network {MAINNET, TESTNET, SIGNET, REGTEST};
enum class Chain {BITCOIN, FRACTAL};

enum class AddressType {P2PKH, P2SH, P2WPKH, P2WSH, P2TR, UNKNOWN};

Network ParseNetwork(const std::string& name);
Chain ParseChain(const std::string& name);
const char* AddressTypeName(AddressType type);

// Encodes and decodes addresses for one network without touching global chain params
class AddressCoder
{
    Network m_network;
    std::string m_hrp;
    uint8_t m_pubkey_prefix;
    uint8_t m_script_prefix;

public:
    explicit AddressCoder(Network network, Chain chain = Chain::BITCOIN);

    Network GetNetwork() const noexcept
    { return m_network; }

    const std::string& Hrp() const noexcept
    { return m_hrp; }

    std::string Encode(const CScript& script_pubkey) const;
    CScript Decode(const std::string& address) const;

    AddressType GetAddressType(const std::string& address) const
    { return GetScriptType(Decode(address)); }

    static AddressType GetScriptType(const CScript& script_pubkey);
};

CScript MakeTaprootScript(const xonly_pubkey& output_pk);
CScript MakeWitnessV0KeyHashScript(const compressed_pubkey& pk);
CScript MakeNestedWitnessRedeemScript(const compressed_pubkey& pk);
CScript MakeScriptHashScript(const CScript& redeem_script);

}

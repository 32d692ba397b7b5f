#include "address.hpp"

#include <iterator>

#include "base58.h"
#include "bech32.h"
#include "hash.h"
#include "script/standard.h"
#include "util/strencodings.h"

namespace ordguard::core {

namespace {

const char* const NETWORK_NAMES[] = {"mainnet", "testnet", "signet", "regtest"};

bytevector KeyHash(Span<const uint8_t> data)
{
    uint160 hash = Hash160(data);
    return bytevector(hash.begin(), hash.end());
}

}

Network ParseNetwork(const std::string& name)
{
    for (size_t i = 0; i < std::size(NETWORK_NAMES); ++i) {
        if (name == NETWORK_NAMES[i]) return static_cast<Network>(i);
    }
    throw InputError("Unknown network: " + name);
}

Chain ParseChain(const std::string& name)
{
    if (name == "bitcoin") return Chain::BITCOIN;
    if (name == "fractal-bitcoin") return Chain::FRACTAL;
    throw InputError("Unknown chain: " + name);
}

const char* AddressTypeName(AddressType type)
{
    switch (type) {
    case AddressType::P2PKH: return "p2pkh";
    case AddressType::P2SH: return "p2sh";
    case AddressType::P2WPKH: return "p2wpkh";
    case AddressType::P2WSH: return "p2wsh";
    case AddressType::P2TR: return "p2tr";
    default: return "unknown";
    }
}

AddressCoder::AddressCoder(Network network, Chain chain)
    : m_network(chain == Chain::FRACTAL ? Network::MAINNET : network)
{
    switch (m_network) {
    case Network::MAINNET:
        m_hrp = "bc";
        m_pubkey_prefix = 0x00;
        m_script_prefix = 0x05;
        break;
    case Network::TESTNET:
    case Network::SIGNET:
        m_hrp = "tb";
        m_pubkey_prefix = 0x6f;
        m_script_prefix = 0xc4;
        break;
    case Network::REGTEST:
        m_hrp = "bcrt";
        m_pubkey_prefix = 0x6f;
        m_script_prefix = 0xc4;
        break;
    }
}

AddressType AddressCoder::GetScriptType(const CScript& script_pubkey)
{
    std::vector<bytevector> solutions;
    switch (Solver(script_pubkey, solutions)) {
    case TxoutType::PUBKEYHASH: return AddressType::P2PKH;
    case TxoutType::SCRIPTHASH: return AddressType::P2SH;
    case TxoutType::WITNESS_V0_KEYHASH: return AddressType::P2WPKH;
    case TxoutType::WITNESS_V0_SCRIPTHASH: return AddressType::P2WSH;
    case TxoutType::WITNESS_V1_TAPROOT: return AddressType::P2TR;
    default: return AddressType::UNKNOWN;
    }
}

std::string AddressCoder::Encode(const CScript& script_pubkey) const
{
    int witver;
    bytevector program;
    if (script_pubkey.IsWitnessProgram(witver, program)) {
        std::vector<unsigned char> bech32buf = {static_cast<unsigned char>(witver)};
        bech32buf.reserve(1 + (program.size() * 8 + 4) / 5);
        ConvertBits<8, 5, true>([&](unsigned char c) { bech32buf.push_back(c); }, program.begin(), program.end());
        return bech32::Encode(witver ? bech32::Encoding::BECH32M : bech32::Encoding::BECH32, m_hrp, bech32buf);
    }

    std::vector<bytevector> solutions;
    TxoutType type = Solver(script_pubkey, solutions);
    if (type == TxoutType::PUBKEYHASH || type == TxoutType::SCRIPTHASH) {
        bytevector data = {type == TxoutType::PUBKEYHASH ? m_pubkey_prefix : m_script_prefix};
        data.insert(data.end(), solutions[0].begin(), solutions[0].end());
        return EncodeBase58Check(data);
    }

    throw AddressConstructionError("No address form for script " + HexStr(script_pubkey));
}

CScript AddressCoder::Decode(const std::string& address) const
{
    bech32::DecodeResult bech_result = bech32::Decode(address);
    if (bech_result.encoding != bech32::Encoding::INVALID) {
        if (bech_result.hrp != m_hrp) {
            throw InputError("Address prefix should be " + m_hrp + ". Address: " + address);
        }
        if (bech_result.data.empty()) {
            throw InputError("Wrong bech32 data (no data decoded): " + address);
        }
        unsigned witver = bech_result.data[0];
        if (witver > 16) {
            throw InputError("Wrong witness version: " + address);
        }
        if (witver == 0 && bech_result.encoding != bech32::Encoding::BECH32) {
            throw InputError("Version 0 witness address must use Bech32 checksum: " + address);
        }
        if (witver != 0 && bech_result.encoding != bech32::Encoding::BECH32M) {
            throw InputError("Version 1+ witness address must use Bech32m checksum: " + address);
        }

        bytevector program;
        if (!ConvertBits<5, 8, false>([&](unsigned char c) { program.push_back(c); }, bech_result.data.begin() + 1, bech_result.data.end())) {
            throw InputError("Wrong bech32 data: " + address);
        }
        if (program.size() < 2 || program.size() > 40 || (witver == 0 && program.size() != 20 && program.size() != 32)) {
            throw InputError("Wrong witness program size: " + address);
        }

        CScript script;
        script << CScript::EncodeOP_N(witver) << program;
        return script;
    }

    bytevector data;
    if (DecodeBase58Check(address, data, 21) && data.size() == 21) {
        bytevector hash(data.begin() + 1, data.end());
        if (data[0] == m_pubkey_prefix) {
            CScript script;
            script << OP_DUP << OP_HASH160 << hash << OP_EQUALVERIFY << OP_CHECKSIG;
            return script;
        }
        if (data[0] == m_script_prefix) {
            CScript script;
            script << OP_HASH160 << hash << OP_EQUAL;
            return script;
        }
        throw InputError("Address belongs to another network: " + address);
    }

    throw InputError("Wrong address: " + address);
}

CScript MakeTaprootScript(const xonly_pubkey& output_pk)
{
    CScript script;
    script << OP_1 << output_pk;
    return script;
}

CScript MakeWitnessV0KeyHashScript(const compressed_pubkey& pk)
{
    CScript script;
    script << OP_0 << KeyHash(pk);
    return script;
}

CScript MakeNestedWitnessRedeemScript(const compressed_pubkey& pk)
{
    return MakeWitnessV0KeyHashScript(pk);
}

CScript MakeScriptHashScript(const CScript& redeem_script)
{
    CScript script;
    script << OP_HASH160 << KeyHash(redeem_script) << OP_EQUAL;
    return script;
}

}

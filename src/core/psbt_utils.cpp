#include "psbt_utils.hpp"

#include "script/interpreter.h"
#include "script/standard.h"
#include "streams.h"
#include "util/strencodings.h"
#include "version.h"

#include "utils.hpp"

namespace ordguard::core {

namespace {

const size_t SCHNORR_SIG_SIZE = 64;
const size_t ECDSA_SIG_SIZE = 72;
const size_t COMPRESSED_PUBKEY_SIZE = 33;
const size_t P2PKH_SCRIPTSIG_SIZE = 107;

void AddPlaceholderWitness(CTxIn& txin, const PSBTInput& input, const CTxOut& utxo)
{
    std::vector<bytevector> solutions;
    switch (Solver(utxo.scriptPubKey, solutions)) {
    case TxoutType::WITNESS_V1_TAPROOT: {
        bool explicit_sighash = input.sighash_type && *input.sighash_type != SIGHASH_DEFAULT;
        txin.scriptWitness.stack = {bytevector(SCHNORR_SIG_SIZE + (explicit_sighash ? 1 : 0))};
        break;
    }
    case TxoutType::WITNESS_V0_KEYHASH:
        txin.scriptWitness.stack = {bytevector(ECDSA_SIG_SIZE), bytevector(COMPRESSED_PUBKEY_SIZE)};
        break;
    case TxoutType::SCRIPTHASH:
        txin.scriptWitness.stack = {bytevector(ECDSA_SIG_SIZE), bytevector(COMPRESSED_PUBKEY_SIZE)};
        break;
    case TxoutType::PUBKEYHASH:
    {
        bytevector placeholder(P2PKH_SCRIPTSIG_SIZE);
        txin.scriptSig = CScript(placeholder.begin(), placeholder.end());
        break;
    }
    default:
        throw UnsupportedScriptType("Size estimation for script " + HexStr(utxo.scriptPubKey));
    }
}

}

std::string EncodePsbtBase64(const PartiallySignedTransaction& psbt)
{
    CDataStream stream(SER_NETWORK, PROTOCOL_VERSION);
    stream << psbt;
    return EncodeBase64(MakeUCharSpan(stream));
}

std::string EncodePsbtHex(const PartiallySignedTransaction& psbt)
{
    CDataStream stream(SER_NETWORK, PROTOCOL_VERSION);
    stream << psbt;
    return HexStr(MakeUCharSpan(stream));
}

PartiallySignedTransaction DecodePsbt(const std::string& psbt_str)
{
    PartiallySignedTransaction psbt;
    if (IsHex(psbt_str)) {
        bytevector raw = unhex<bytevector>(psbt_str);
        CDataStream stream(MakeByteSpan(raw), SER_NETWORK, PROTOCOL_VERSION);
        try {
            stream >> psbt;
        }
        catch (const std::exception&) {
            std::throw_with_nested(InputError("PSBT hex decode"));
        }
        if (!stream.empty()) {
            throw InputError("Extra data after PSBT");
        }
    }
    else {
        std::string error;
        if (!DecodeBase64PSBT(psbt, psbt_str, error)) {
            throw InputError("PSBT decode: " + error);
        }
    }
    return psbt;
}

const CMutableTransaction& GetUnsignedTx(const PartiallySignedTransaction& psbt)
{
    if (!psbt.tx) {
        throw InputError("PSBT has no unsigned transaction");
    }
    return *psbt.tx;
}

CMutableTransaction GetTxWithRedeemScripts(const PartiallySignedTransaction& psbt)
{
    CMutableTransaction tx = GetUnsignedTx(psbt);
    for (size_t i = 0; i < tx.vin.size() && i < psbt.inputs.size(); ++i) {
        const CScript& redeem_script = psbt.inputs[i].redeem_script;
        if (!redeem_script.empty()) {
            tx.vin[i].scriptSig = CScript() << bytevector(redeem_script.begin(), redeem_script.end());
        }
    }
    return tx;
}

uint256 GetTxid(const PartiallySignedTransaction& psbt)
{
    return GetTxWithRedeemScripts(psbt).GetHash();
}

CTxOut GetInputUtxo(const PartiallySignedTransaction& psbt, size_t nin)
{
    const CMutableTransaction& tx = GetUnsignedTx(psbt);
    if (nin >= psbt.inputs.size() || nin >= tx.vin.size()) {
        throw InputError("PSBT input index is out of range: " + std::to_string(nin));
    }
    const PSBTInput& input = psbt.inputs[nin];
    if (!input.witness_utxo.IsNull()) {
        return input.witness_utxo;
    }
    if (input.non_witness_utxo) {
        uint32_t n = tx.vin[nin].prevout.n;
        if (n >= input.non_witness_utxo->vout.size()) {
            throw InputError("PSBT non-witness utxo has no output " + std::to_string(n));
        }
        return input.non_witness_utxo->vout[n];
    }
    throw InputError("PSBT input " + std::to_string(nin) + " has no utxo data");
}

CAmount GetInputsAmount(const PartiallySignedTransaction& psbt)
{
    CAmount total = 0;
    for (size_t i = 0; i < psbt.inputs.size(); ++i) {
        total += GetInputUtxo(psbt, i).nValue;
    }
    return total;
}

CAmount GetOutputsAmount(const PartiallySignedTransaction& psbt)
{
    CAmount total = 0;
    for (const auto& out: GetUnsignedTx(psbt).vout) {
        total += out.nValue;
    }
    return total;
}

CAmount GetTotalFees(const PartiallySignedTransaction& psbt)
{
    return GetInputsAmount(psbt) - GetOutputsAmount(psbt);
}

size_t GetVBytes(const PartiallySignedTransaction& psbt)
{
    CMutableTransaction tx = GetTxWithRedeemScripts(psbt);
    for (size_t i = 0; i < tx.vin.size(); ++i) {
        AddPlaceholderWitness(tx.vin[i], psbt.inputs[i], GetInputUtxo(psbt, i));
    }
    return GetVirtualSize(tx);
}

std::string FormatOutpoint(const COutPoint& outpoint)
{
    return outpoint.hash.GetHex() + ":" + std::to_string(outpoint.n);
}

COutPoint ParseOutpoint(const std::string& outpoint)
{
    auto pos = outpoint.rfind(':');
    if (pos == std::string::npos || pos != 64) {
        throw InputError("Wrong outpoint: " + outpoint);
    }
    std::string txid = outpoint.substr(0, pos);
    if (!IsHex(txid)) {
        throw InputError("Wrong outpoint txid: " + outpoint);
    }

    uint32_t n = 0;
    std::string_view index(outpoint.data() + pos + 1, outpoint.size() - pos - 1);
    auto res = std::from_chars(index.data(), index.data() + index.size(), n);
    if (index.empty() || res.ec != std::errc() || res.ptr != index.data() + index.size()) {
        throw InputError("Wrong outpoint index: " + outpoint);
    }
    return COutPoint(uint256S(txid), n);
}

}

#include "input_chaining.hpp"

#include "pubkey.h"
#include "script/standard.h"
#include "util/strencodings.h"

#include "address.hpp"

namespace ordguard::protection {

namespace {

void AddInput(PartiallySignedTransaction& psbt, const COutPoint& prevout, PSBTInput& input)
{
    if (!psbt.AddInput(CTxIn(prevout), input)) {
        throw TransactionError("Input is already spent by the transaction: " + core::FormatOutpoint(prevout));
    }
}

}

ChainedInput GenerateInputFromPSBTOutput(const PartiallySignedTransaction& psbt, uint32_t nout, const uint256& txid,
                                         const xonly_pubkey& internal_key, std::optional<int> sighash_type)
{
    const CMutableTransaction& tx = core::GetUnsignedTx(psbt);
    if (nout >= tx.vout.size()) {
        throw InputError("Output index " + std::to_string(nout) + " is out of range for transaction " + txid.GetHex());
    }

    const CTxOut& out = tx.vout[nout];
    COutPoint prevout(txid, nout);

    switch (core::AddressCoder::GetScriptType(out.scriptPubKey)) {
    case core::AddressType::P2TR:
        return TaprootSpend{prevout, out, internal_key, sighash_type};
    case core::AddressType::P2WPKH:
        return WitnessV0KeyHashSpend{prevout, out, sighash_type};
    default:
        throw UnsupportedScriptType("Only p2tr and p2wpkh outputs can be chained: " + HexStr(out.scriptPubKey));
    }
}

void AddChainedInput(PartiallySignedTransaction& psbt, const ChainedInput& input, const std::optional<uint256>& merkle_root)
{
    PSBTInput psbt_input;
    COutPoint prevout;

    if (const auto* taproot = std::get_if<TaprootSpend>(&input)) {
        prevout = taproot->prevout;
        psbt_input.witness_utxo = taproot->witness_utxo;
        psbt_input.m_tap_internal_key = XOnlyPubKey(taproot->internal_key);
        if (merkle_root) {
            psbt_input.m_tap_merkle_root = *merkle_root;
        }
        psbt_input.sighash_type = taproot->sighash_type;
    }
    else {
        const auto& keyhash = std::get<WitnessV0KeyHashSpend>(input);
        prevout = keyhash.prevout;
        psbt_input.witness_utxo = keyhash.witness_utxo;
        psbt_input.sighash_type = keyhash.sighash_type;
    }

    AddInput(psbt, prevout, psbt_input);
}

void AddUtxoInput(PartiallySignedTransaction& psbt, const UTXO& utxo, const core::TaprootKeys& key, std::optional<int> sighash_type)
{
    PSBTInput psbt_input;
    psbt_input.witness_utxo = CTxOut(utxo.value, utxo.script_pubkey);
    psbt_input.sighash_type = sighash_type;

    switch (core::AddressCoder::GetScriptType(utxo.script_pubkey)) {
    case core::AddressType::P2TR:
        if (core::MakeTaprootScript(key.AddTapTweak(std::nullopt).first) != utxo.script_pubkey) {
            throw InputError("P2TR output does not belong to the key: " + utxo.txid + ":" + std::to_string(utxo.vout));
        }
        psbt_input.m_tap_internal_key = XOnlyPubKey(key.GetPubKey());
        break;
    case core::AddressType::P2WPKH:
        if (core::MakeWitnessV0KeyHashScript(key.GetCompressedPubKey()) != utxo.script_pubkey) {
            throw InputError("P2WPKH output does not belong to the key: " + utxo.txid + ":" + std::to_string(utxo.vout));
        }
        break;
    case core::AddressType::P2SH: {
        CScript redeem_script = core::MakeNestedWitnessRedeemScript(key.GetCompressedPubKey());
        if (core::MakeScriptHashScript(redeem_script) != utxo.script_pubkey) {
            throw UnsupportedScriptType("P2SH output is not a nested p2wpkh of the key: " + utxo.txid + ":" + std::to_string(utxo.vout));
        }
        psbt_input.redeem_script = move(redeem_script);
        break;
    }
    default:
        throw UnsupportedScriptType("Wallet utxo script is not supported: " + HexStr(utxo.script_pubkey));
    }

    if (!IsHex(utxo.txid) || utxo.txid.size() != 64) {
        throw InputError("Wrong utxo txid: " + utxo.txid);
    }
    AddInput(psbt, COutPoint(uint256S(utxo.txid), utxo.vout), psbt_input);
}

void AddOutput(PartiallySignedTransaction& psbt, const CTxOut& out)
{
    if (!psbt.AddOutput(out, PSBTOutput())) {
        throw TransactionError("PSBT output");
    }
}

}

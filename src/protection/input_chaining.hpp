#pragma once

#include <optional>
#include <variant>

#include "primitives/transaction.h"
#include "psbt.h"
#include "uint256.h"

#include "common.hpp"
#include "datasource.hpp"
#include "psbt_utils.hpp"
#include "taproot_keys.hpp"

namespace ordguard::protection {

struct TaprootSpend
{
    COutPoint prevout;
    CTxOut witness_utxo;
    xonly_pubkey internal_key;
    std::optional<int> sighash_type;
};

struct WitnessV0KeyHashSpend
{
    COutPoint prevout;
    CTxOut witness_utxo;
    std::optional<int> sighash_type;
};

typedef std::variant<TaprootSpend, WitnessV0KeyHashSpend> ChainedInput;

ChainedInput GenerateInputFromPSBTOutput(const PartiallySignedTransaction& psbt, uint32_t nout, const uint256& txid,
                                         const xonly_pubkey& internal_key, std::optional<int> sighash_type = {});

inline ChainedInput GenerateInputFromPSBTOutput(const PartiallySignedTransaction& psbt, uint32_t nout,
                                                const xonly_pubkey& internal_key, std::optional<int> sighash_type = {})
{ return GenerateInputFromPSBTOutput(psbt, nout, core::GetTxid(psbt), internal_key, sighash_type); }

// Merkle root applies to taproot spends only
void AddChainedInput(PartiallySignedTransaction& psbt, const ChainedInput& input, const std::optional<uint256>& merkle_root = {});

// Adds a wallet UTXO owned by the given key as an input
void AddUtxoInput(PartiallySignedTransaction& psbt, const UTXO& utxo, const core::TaprootKeys& key, std::optional<int> sighash_type = {});

void AddOutput(PartiallySignedTransaction& psbt, const CTxOut& out);

}

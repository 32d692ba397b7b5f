#pragma once

#include <string>

#include "consensus/amount.h"
#include "primitives/transaction.h"
#include "psbt.h"

#include "common.hpp"

namespace ordguard::core {

std::string EncodePsbtBase64(const PartiallySignedTransaction& psbt);
std::string EncodePsbtHex(const PartiallySignedTransaction& psbt);

// Accepts both base64 and hex serialization
PartiallySignedTransaction DecodePsbt(const std::string& psbt_str);

const CMutableTransaction& GetUnsignedTx(const PartiallySignedTransaction& psbt);

// Copy of the unsigned tx with P2SH redeem scripts pushed into scriptSigs, so the txid matches the one broadcasted
CMutableTransaction GetTxWithRedeemScripts(const PartiallySignedTransaction& psbt);
uint256 GetTxid(const PartiallySignedTransaction& psbt);

CTxOut GetInputUtxo(const PartiallySignedTransaction& psbt, size_t nin);

CAmount GetInputsAmount(const PartiallySignedTransaction& psbt);
CAmount GetOutputsAmount(const PartiallySignedTransaction& psbt);
CAmount GetTotalFees(const PartiallySignedTransaction& psbt);

// Virtual size after signing, estimated with placeholder signatures
size_t GetVBytes(const PartiallySignedTransaction& psbt);

std::string FormatOutpoint(const COutPoint& outpoint);
COutPoint ParseOutpoint(const std::string& outpoint);

}

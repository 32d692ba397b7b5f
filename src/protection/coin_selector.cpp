#include "coin_selector.hpp"

#include <numeric>

#include "script/standard.h"

#include "address.hpp"
#include "psbt_utils.hpp"

namespace ordguard::protection {

size_t ICoinSelector::GetVBytes(const PartiallySignedTransaction& psbt) const
{
    return core::GetVBytes(psbt);
}

CAmount ICoinSelector::CalculateFundingAmount(const PartiallySignedTransaction& psbt, const CFeeRate& fee_rate) const
{
    CAmount fee = fee_rate.GetFee(GetVBytes(psbt));
    return core::GetOutputsAmount(psbt) + fee - core::GetInputsAmount(psbt);
}

size_t AccumulativeCoinSelector::InputVBytes(const CScript& script_pubkey)
{
    switch (core::AddressCoder::GetScriptType(script_pubkey)) {
    case core::AddressType::P2TR: return 58;
    case core::AddressType::P2WPKH: return 68;
    case core::AddressType::P2SH: return 91;
    case core::AddressType::P2PKH: return 148;
    default:
        throw UnsupportedScriptType("Coin selection over script " + hex(script_pubkey));
    }
}

size_t AccumulativeCoinSelector::OutputVBytes(const CScript& script_pubkey)
{
    return 8 + 1 + script_pubkey.size();
}

CoinSelection AccumulativeCoinSelector::Finalize(std::vector<UTXO>&& inputs, const std::vector<CTxOut>& targets,
                                                 const CFeeRate& fee_rate, const CScript& change_script) const
{
    size_t vbytes = TX_OVERHEAD_VBYTES;
    CAmount in_value = 0;
    for (const auto& utxo: inputs) {
        vbytes += InputVBytes(utxo.script_pubkey);
        in_value += utxo.value;
    }
    CAmount out_value = 0;
    for (const auto& out: targets) {
        vbytes += OutputVBytes(out.scriptPubKey);
        out_value += out.nValue;
    }

    CoinSelection res;
    res.inputs = move(inputs);
    res.outputs = targets;
    res.fee = fee_rate.GetFee(vbytes);

    CAmount change_fee = fee_rate.GetFee(vbytes + OutputVBytes(change_script)) - res.fee;
    CAmount remainder = in_value - out_value - res.fee - change_fee;
    if (remainder > DUST_LIMIT) {
        res.outputs.emplace_back(remainder, change_script);
        res.fee += change_fee;
    }
    else {
        // Leftover below dust goes to the miner
        res.fee = in_value - out_value;
    }
    return res;
}

std::optional<CoinSelection> AccumulativeCoinSelector::Blackjack(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                                                                 const CFeeRate& fee_rate, const CScript& change_script) const
{
    size_t vbytes = TX_OVERHEAD_VBYTES;
    CAmount out_value = 0;
    for (const auto& out: targets) {
        vbytes += OutputVBytes(out.scriptPubKey);
        out_value += out.nValue;
    }
    // Anything left over below the cost of a change output goes to the miner
    CAmount threshold = fee_rate.GetFee(OutputVBytes(change_script)) + DUST_LIMIT;

    std::vector<UTXO> selected;
    CAmount in_value = 0;
    for (const auto& utxo: candidates) {
        size_t input_vbytes = InputVBytes(utxo.script_pubkey);
        CAmount fee = fee_rate.GetFee(vbytes + input_vbytes);
        if (in_value + utxo.value > out_value + fee + threshold) continue;

        selected.push_back(utxo);
        in_value += utxo.value;
        vbytes += input_vbytes;

        if (in_value >= out_value + fee) {
            return Finalize(move(selected), targets, fee_rate, change_script);
        }
    }
    return {};
}

std::optional<CoinSelection> AccumulativeCoinSelector::Accumulative(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                                                                    const CFeeRate& fee_rate, const CScript& change_script) const
{
    size_t vbytes = TX_OVERHEAD_VBYTES;
    CAmount out_value = 0;
    for (const auto& out: targets) {
        vbytes += OutputVBytes(out.scriptPubKey);
        out_value += out.nValue;
    }

    std::vector<UTXO> selected;
    CAmount in_value = 0;
    for (const auto& utxo: candidates) {
        size_t input_vbytes = InputVBytes(utxo.script_pubkey);
        CAmount input_fee = fee_rate.GetFee(input_vbytes);

        // Skip inputs costing more than they bring
        if (utxo.value < input_fee) continue;

        selected.push_back(utxo);
        in_value += utxo.value;
        vbytes += input_vbytes;

        if (in_value >= out_value + fee_rate.GetFee(vbytes)) {
            return Finalize(move(selected), targets, fee_rate, change_script);
        }
    }
    return {};
}

CoinSelection AccumulativeCoinSelector::Select(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                                               const CFeeRate& fee_rate, const CScript& change_script) const
{
    if (targets.empty()) {
        throw NoOutputSelected("No outputs to fund");
    }
    for (const auto& out: targets) {
        if (out.nValue <= 0) {
            throw InputError("Output value is required");
        }
    }

    if (auto res = Blackjack(candidates, targets, fee_rate, change_script)) {
        return move(*res);
    }
    if (auto res = Accumulative(candidates, targets, fee_rate, change_script)) {
        return move(*res);
    }

    CAmount available = std::accumulate(candidates.begin(), candidates.end(), CAmount(0),
                                        [](CAmount sum, const UTXO& u) { return sum + u.value; });
    CAmount required = std::accumulate(targets.begin(), targets.end(), CAmount(0),
                                       [](CAmount sum, const CTxOut& o) { return sum + o.nValue; });
    throw InsufficientFunds("Not enough funds: available " + std::to_string(available) + " sats, required " + std::to_string(required) + " sats plus fee");
}

}

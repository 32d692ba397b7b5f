#include "protected_purchase.hpp"

#include <algorithm>
#include <execution>
#include <iostream>
#include <numeric>

#include "script/interpreter.h"

#include "input_chaining.hpp"
#include "psbt_utils.hpp"
#include "utils.hpp"

namespace ordguard::protection {

const CFeeRate ProtectedPurchaseBuilder::BASE_FEE_RATE(2000);
const CAmount ProtectedPurchaseBuilder::DUMMY_INPUT_AMOUNT = 600;
const CAmount ProtectedPurchaseBuilder::INITIAL_CPFP_FUNDING = 600;
const size_t ProtectedPurchaseBuilder::MAX_FEE_ITERATIONS = 32;

namespace {

const stringvector BUYER_UTXO_RARITY = {"common", "uncommon"};

// Runs f(i) for every index concurrently, then rethrows the first failure in index order
template <typename F>
void ParallelForEach(size_t count, F&& f)
{
    std::vector<size_t> indexes(count);
    std::iota(indexes.begin(), indexes.end(), 0);
    std::vector<std::exception_ptr> errors(count);

    std::for_each(std::execution::par, indexes.begin(), indexes.end(), [&](size_t i) {
        try {
            f(i);
        }
        catch (...) {
            errors[i] = std::current_exception();
        }
    });

    for (const auto& error: errors) {
        if (error) std::rethrow_exception(error);
    }
}

}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::EscrowPubKey(std::string pubkey)
{
    core::TaprootKeys check(pubkey);
    m_escrow_pk = move(pubkey);
    return *this;
}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::InscriptionPSBTs(const std::vector<std::string>& psbts)
{
    std::vector<PartiallySignedTransaction> decoded;
    decoded.reserve(psbts.size());
    for (const auto& psbt: psbts) {
        decoded.emplace_back(core::DecodePsbt(psbt));
    }
    m_inscription_psbts = move(decoded);
    return *this;
}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::BuyerAddress(std::string address)
{
    m_buyer_address = move(address);
    return *this;
}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::BuyerPubKey(std::string pubkey)
{
    core::TaprootKeys check(pubkey);
    m_buyer_pk = move(pubkey);
    return *this;
}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::ReceiveAddress(std::string address)
{
    Coder().Decode(address);
    m_receive_address = move(address);
    return *this;
}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::EffectiveFeeRate(const CFeeRate& fee_rate)
{
    if (fee_rate.GetFeePerK() <= 0) {
        throw InputError("Fee rate should be positive");
    }
    m_effective_fee_rate = fee_rate;
    return *this;
}

ProtectedPurchaseBuilder& ProtectedPurchaseBuilder::ExtraOutputs(const std::vector<std::pair<std::string, CAmount>>& outputs)
{
    std::vector<CTxOut> extra_outputs;
    extra_outputs.reserve(outputs.size());
    for (const auto& [address, amount]: outputs) {
        if (amount <= 0) {
            throw InputError("Extra output amount should be positive: " + address);
        }
        extra_outputs.emplace_back(amount, Coder().Decode(address));
    }
    m_extra_outputs = move(extra_outputs);
    return *this;
}

void ProtectedPurchaseBuilder::CheckBuildParameters() const
{
    if (m_inscription_psbts.empty()) throw InputError("Inscription PSBTs are required");
    if (!m_escrow_pk) throw InputError("Escrow public key is required");
    if (!m_buyer_address) throw InputError("Buyer address is required");
    if (!m_buyer_pk) throw InputError("Buyer public key is required");
    if (!m_receive_address) throw InputError("Receive address is required");
    if (!m_effective_fee_rate) throw InputError("Fee rate is required");

    core::AddressType buyer_type = Coder().GetAddressType(*m_buyer_address);
    if (buyer_type != core::AddressType::P2SH && buyer_type != core::AddressType::P2WSH &&
        buyer_type != core::AddressType::P2WPKH && buyer_type != core::AddressType::P2TR) {
        throw InputError("Buyer address " + *m_buyer_address + " must be a segwit/taproot/p2sh address, got " + AddressTypeName(buyer_type));
    }
}

void ProtectedPurchaseBuilder::ValidateInscriptionPSBT(const PartiallySignedTransaction& psbt) const
{
    const CMutableTransaction& tx = core::GetUnsignedTx(psbt);

    size_t witness_inputs = std::count_if(psbt.inputs.begin(), psbt.inputs.end(), [](const PSBTInput& in) { return !in.witness_utxo.IsNull(); });
    if (tx.vin.size() != 1 || witness_inputs != 1) {
        throw InvalidSellerPst("Seller PSBT must have exactly one input with witness utxo");
    }

    std::string seller_address;
    try {
        seller_address = Coder().Encode(psbt.inputs.front().witness_utxo.scriptPubKey);
    }
    catch (const Error&) {
        std::throw_with_nested(InvalidSellerPst("Invalid seller address in PSBT"));
    }

    const COutPoint& inscription_outpoint = tx.vin.front().prevout;
    std::string outpoint = core::FormatOutpoint(inscription_outpoint);

    std::vector<InscriptionRecord> inscriptions = DataSource().GetInscriptions(outpoint);
    if (inscriptions.empty()) {
        throw InscriptionNotFound("Inscription at " + outpoint + " not found");
    }

    bool owned = std::any_of(inscriptions.begin(), inscriptions.end(), [&](const InscriptionRecord& rec) {
        return rec.outpoint == outpoint && rec.owner == seller_address;
    });
    if (!owned) {
        throw InscriptionOwnershipMismatch("Inscription at " + outpoint + " does not belong to " + seller_address);
    }

    CommitmentAddress escrow = m_commitment_builder.BuildEscrowAddress(inscription_outpoint, *m_escrow_pk);
    if (tx.vout.empty() || tx.vout.front().scriptPubKey != escrow.script_pubkey) {
        throw InvalidSellerPst("Seller PSBT output 0 must pay to escrow address " + escrow.address);
    }
}

void ProtectedPurchaseBuilder::ValidateInscriptionPSBTs() const
{
    ParallelForEach(m_inscription_psbts.size(), [this](size_t i) {
        ValidateInscriptionPSBT(m_inscription_psbts[i]);
    });
}

std::vector<UTXO> ProtectedPurchaseBuilder::FetchBuyerUtxos() const
{
    UnspentsQuery query;
    query.address = *m_buyer_address;
    query.rarity = BUYER_UTXO_RARITY;
    query.type = "spendable";
    query.sort = "desc";

    UnspentsResponse unspents = DataSource().GetUnspents(query);
    if (unspents.spendable.empty()) {
        throw NoSpendableUtxos("No spendable utxos found for " + *m_buyer_address);
    }
    return move(unspents.spendable);
}

std::vector<CAmount> ProtectedPurchaseBuilder::CalculateInscriptionFunding(const BuildSession& session) const
{
    std::vector<CAmount> res;
    res.reserve(m_inscription_psbts.size());

    for (const auto& seller_psbt: m_inscription_psbts) {
        PartiallySignedTransaction psbt = seller_psbt;

        // Placeholder for the buyer input so the estimate includes its weight
        TaprootSpend dummy{COutPoint(uint256(), 0), CTxOut(DUMMY_INPUT_AMOUNT, session.buyer_commitment.script_pubkey),
                           session.buyer_commitment.internal_key, SIGHASH_ALL};
        AddChainedInput(psbt, dummy, session.buyer_commitment.merkle_root);

        res.push_back(CoinSelector().CalculateFundingAmount(psbt, BASE_FEE_RATE) + DUMMY_INPUT_AMOUNT);
    }
    return res;
}

FirstTransaction ProtectedPurchaseBuilder::BuildFirstTransaction(const BuildSession& session) const
{
    std::vector<CTxOut> targets;
    targets.reserve(session.inscription_funding.size() + 1);
    for (CAmount funding: session.inscription_funding) {
        targets.emplace_back(funding, session.buyer_commitment.script_pubkey);
    }
    targets.emplace_back(session.cpfp_funding, session.buyer_commitment.script_pubkey);

    CoinSelection selection = CoinSelector().Select(session.buyer_utxos, targets, BASE_FEE_RATE, Coder().Decode(*m_buyer_address));
    if (selection.inputs.empty()) {
        throw InsufficientFunds("No input utxo found. Not enough funds.");
    }
    if (selection.outputs.empty()) {
        throw NoOutputSelected("No output found");
    }

    FirstTransaction res;
    res.psbt.tx = CMutableTransaction();
    for (const auto& utxo: selection.inputs) {
        AddUtxoInput(res.psbt, utxo, session.buyer_key);
    }
    for (const auto& out: selection.outputs) {
        AddOutput(res.psbt, out);
    }
    res.txid = core::GetTxid(res.psbt);
    return res;
}

std::vector<PartiallySignedTransaction> ProtectedPurchaseBuilder::BuildSecondTransactions(const BuildSession& session, const FirstTransaction& first) const
{
    std::vector<PartiallySignedTransaction> res(m_inscription_psbts.size());

    ParallelForEach(m_inscription_psbts.size(), [&](size_t i) {
        PartiallySignedTransaction psbt = m_inscription_psbts[i];
        ChainedInput funding = GenerateInputFromPSBTOutput(first.psbt, static_cast<uint32_t>(i), first.txid,
                                                           session.buyer_commitment.internal_key, SIGHASH_ALL);
        AddChainedInput(psbt, funding, session.buyer_commitment.merkle_root);
        res[i] = move(psbt);
    });

    return res;
}

PartiallySignedTransaction ProtectedPurchaseBuilder::BuildWithdrawTransaction(const BuildSession& session, const FirstTransaction& first,
                                                                              const std::vector<PartiallySignedTransaction>& seconds) const
{
    PartiallySignedTransaction psbt;
    psbt.tx = CMutableTransaction();

    CScript receive_script = Coder().Decode(*m_receive_address);

    for (const auto& second: seconds) {
        const CMutableTransaction& second_tx = core::GetUnsignedTx(second);

        CommitmentAddress escrow = m_commitment_builder.BuildEscrowAddress(second_tx.vin.front().prevout, *m_escrow_pk);
        ChainedInput escrow_input = GenerateInputFromPSBTOutput(second, 0, escrow.internal_key, SIGHASH_ALL);
        AddChainedInput(psbt, escrow_input, escrow.merkle_root);

        AddOutput(psbt, CTxOut(second_tx.vout.front().nValue, receive_script));
    }

    for (const auto& out: m_extra_outputs) {
        AddOutput(psbt, out);
    }

    ChainedInput cpfp_input = GenerateInputFromPSBTOutput(first.psbt, static_cast<uint32_t>(seconds.size()), first.txid,
                                                          session.buyer_commitment.internal_key, SIGHASH_ALL);
    AddChainedInput(psbt, cpfp_input, session.buyer_commitment.merkle_root);

    return psbt;
}

BuildTransactionsResponse ProtectedPurchaseBuilder::BuildTransactions(const std::string& unique_id) const
{
    CheckBuildParameters();
    ValidateInscriptionPSBTs();

    BuildSession session {core::TaprootKeys(*m_buyer_pk), FetchBuyerUtxos(),
                          m_commitment_builder.BuildBuyerAddress(*m_buyer_pk, *m_buyer_address, unique_id),
                          {}, INITIAL_CPFP_FUNDING};
    session.inscription_funding = CalculateInscriptionFunding(session);

    for (size_t iteration = 0; iteration < MAX_FEE_ITERATIONS; ++iteration) {
        FirstTransaction first = BuildFirstTransaction(session);
        std::vector<PartiallySignedTransaction> seconds = BuildSecondTransactions(session, first);
        PartiallySignedTransaction third = BuildWithdrawTransaction(session, first, seconds);

        size_t total_vbytes = CoinSelector().GetVBytes(first.psbt);
        CAmount paid_fees = core::GetTotalFees(first.psbt);
        for (const auto& second: seconds) {
            total_vbytes += CoinSelector().GetVBytes(second);
            paid_fees += core::GetTotalFees(second);
        }
        size_t third_vbytes = CoinSelector().GetVBytes(third);
        total_vbytes += third_vbytes;

        CAmount shortfall = m_effective_fee_rate->GetFee(static_cast<uint32_t>(total_vbytes)) - paid_fees;
        CAmount cpfp_rate_per_k = shortfall > 0 ? (shortfall * 1000 + static_cast<CAmount>(third_vbytes) - 1) / static_cast<CAmount>(third_vbytes) : 0;
        CFeeRate cpfp_fee_rate(cpfp_rate_per_k);

        CAmount extra_funding = CoinSelector().CalculateFundingAmount(third, cpfp_fee_rate);

        if (m_verbose) {
            std::clog << "Fee iteration " << iteration << ": total vbytes " << total_vbytes
                      << ", paid fees " << paid_fees << ", CPFP fee rate " << cpfp_fee_rate.ToString()
                      << ", CPFP funding " << session.cpfp_funding << ", extra funding " << extra_funding << std::endl;
        }

        if (extra_funding <= 0) {
            if (m_verbose) {
                LogTx(core::GetTxWithRedeemScripts(first.psbt));
                for (const auto& second: seconds) LogTx(core::GetUnsignedTx(second));
                LogTx(core::GetUnsignedTx(third));
            }

            BuildTransactionsResponse res;
            res.first_transaction_psbt_base64 = core::EncodePsbtBase64(first.psbt);
            res.second_transaction_psbt_base64.reserve(seconds.size());
            for (const auto& second: seconds) {
                res.second_transaction_psbt_base64.emplace_back(core::EncodePsbtBase64(second));
            }
            res.third_transaction_psbt_base64 = core::EncodePsbtBase64(third);
            return res;
        }

        session.cpfp_funding += extra_funding;
    }

    throw FeeConvergenceTimeout("CPFP funding did not converge in " + std::to_string(MAX_FEE_ITERATIONS) + " iterations");
}

PartiallySignedTransaction ProtectedPurchaseBuilder::CreateInscriptionPSBT(const std::string& inscription_id,
                                                                           const std::string& seller_pk,
                                                                           const std::string& seller_address,
                                                                           const std::string& payment_address,
                                                                           CAmount price,
                                                                           const std::string& escrow_pk,
                                                                           const IDataSource& datasource,
                                                                           core::Network network, core::Chain chain)
{
    if (price <= 0) {
        throw InputError("Price should be positive");
    }

    CommitmentAddressBuilder commitment_builder(network, chain);
    CScript payment_script = commitment_builder.Coder().Decode(payment_address);

    std::optional<UTXO> utxo = datasource.GetInscriptionUTXO(inscription_id);
    if (!utxo) {
        throw InscriptionNotFound("Inscription " + inscription_id + " not found");
    }
    if (utxo->address != seller_address) {
        throw InscriptionOwnershipMismatch("Inscription " + inscription_id + " does not belong to seller " + seller_address);
    }

    PartiallySignedTransaction psbt;
    psbt.tx = CMutableTransaction();

    AddUtxoInput(psbt, *utxo, core::TaprootKeys(seller_pk), SIGHASH_ALL | SIGHASH_ANYONECANPAY);

    CommitmentAddress escrow = commitment_builder.BuildEscrowAddress(core::GetUnsignedTx(psbt).vin.front().prevout, escrow_pk);
    AddOutput(psbt, CTxOut(utxo->value, escrow.script_pubkey));
    AddOutput(psbt, CTxOut(price, payment_script));

    return psbt;
}

}

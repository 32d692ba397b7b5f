#pragma once

#include <optional>
#include <string>
#include <vector>

#include "policy/feerate.h"
#include "psbt.h"

#include "contract_builder.hpp"
#include "taproot_keys.hpp"

namespace ordguard::protection {

struct BuildTransactionsResponse
{
    std::string first_transaction_psbt_base64;
    std::vector<std::string> second_transaction_psbt_base64;
    std::string third_transaction_psbt_base64;
};

struct FirstTransaction
{
    PartiallySignedTransaction psbt;
    uint256 txid;
};

// Mutable state of one BuildTransactions call
struct BuildSession
{
    core::TaprootKeys buyer_key;
    std::vector<UTXO> buyer_utxos;
    CommitmentAddress buyer_commitment;
    std::vector<CAmount> inscription_funding;
    CAmount cpfp_funding;
};

/**
 * Builds the three transaction purchase chain:
 *  1. buyer funds are split into exact amounts on the buyer commitment address, one output per inscription plus the CPFP output;
 *  2. per inscription: seller PSBT (inscription to escrow, price to seller) completed with the buyer funding input;
 *  3. withdraw: all escrow outputs go to the buyer receive address, the CPFP output pays the fee of the whole chain.
 */
class ProtectedPurchaseBuilder : public ContractBuilder
{
public:
    static const CFeeRate BASE_FEE_RATE;
    static const CAmount DUMMY_INPUT_AMOUNT;
    static const CAmount INITIAL_CPFP_FUNDING;
    static const size_t MAX_FEE_ITERATIONS;

private:
    std::optional<std::string> m_escrow_pk;
    std::vector<PartiallySignedTransaction> m_inscription_psbts;
    std::optional<std::string> m_buyer_address;
    std::optional<std::string> m_buyer_pk;
    std::optional<std::string> m_receive_address;
    std::optional<CFeeRate> m_effective_fee_rate;
    std::vector<CTxOut> m_extra_outputs;

    void CheckBuildParameters() const;
    void ValidateInscriptionPSBT(const PartiallySignedTransaction& psbt) const;
    void ValidateInscriptionPSBTs() const;
    std::vector<UTXO> FetchBuyerUtxos() const;

    std::vector<CAmount> CalculateInscriptionFunding(const BuildSession& session) const;
    FirstTransaction BuildFirstTransaction(const BuildSession& session) const;
    std::vector<PartiallySignedTransaction> BuildSecondTransactions(const BuildSession& session, const FirstTransaction& first) const;
    PartiallySignedTransaction BuildWithdrawTransaction(const BuildSession& session, const FirstTransaction& first,
                                                        const std::vector<PartiallySignedTransaction>& seconds) const;

public:
    using ContractBuilder::ContractBuilder;

    ProtectedPurchaseBuilder& EscrowPubKey(std::string pubkey);
    ProtectedPurchaseBuilder& InscriptionPSBTs(const std::vector<std::string>& psbts);
    ProtectedPurchaseBuilder& BuyerAddress(std::string address);
    ProtectedPurchaseBuilder& BuyerPubKey(std::string pubkey);
    ProtectedPurchaseBuilder& ReceiveAddress(std::string address);
    ProtectedPurchaseBuilder& EffectiveFeeRate(const CFeeRate& fee_rate);
    ProtectedPurchaseBuilder& ExtraOutputs(const std::vector<std::pair<std::string, CAmount>>& outputs);
    ProtectedPurchaseBuilder& Verbose(bool verbose)
    { m_verbose = verbose; return *this; }

    // uniqueId keeps the buyer commitment address private and stable between calls
    BuildTransactionsResponse BuildTransactions(const std::string& unique_id) const;

    static PartiallySignedTransaction CreateInscriptionPSBT(const std::string& inscription_id,
                                                            const std::string& seller_pk,
                                                            const std::string& seller_address,
                                                            const std::string& payment_address,
                                                            CAmount price,
                                                            const std::string& escrow_pk,
                                                            const IDataSource& datasource,
                                                            core::Network network, core::Chain chain);
};

}

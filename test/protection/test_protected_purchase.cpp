#include <atomic>
#include <iostream>
#include <memory>

#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include "util/translation.h"
#include "script/interpreter.h"

#include "protected_purchase.hpp"
#include "psbt_utils.hpp"
#include "coin_selector.hpp"
#include "address.hpp"

#include "../testlib/test_keys.hpp"
#include "../testlib/mock_datasource.hpp"

using namespace ordguard;
using namespace ordguard::core;
using namespace ordguard::protection;

const std::function<std::string(const char*)> G_TRANSLATION_FUN = nullptr;

namespace {

const Network NETWORK = Network::REGTEST;
const Chain CHAIN = Chain::BITCOIN;
const CAmount PRICE = 100000;
const CAmount INSCRIPTION_VALUE = 10000;

// Never reports enough funding, so the CPFP output is grown on every round
class NeverFundedSelector : public AccumulativeCoinSelector
{
public:
    mutable std::atomic<size_t> funding_requests = 0;

    CAmount CalculateFundingAmount(const PartiallySignedTransaction&, const CFeeRate&) const override
    {
        ++funding_requests;
        return 1;
    }
};

struct PurchaseFixture
{
    AddressCoder coder {NETWORK};

    std::string seller_pk = test::CompressedPubKeyHex(test::SELLER_SK);
    std::string buyer_pk = test::CompressedPubKeyHex(test::BUYER_SK);
    std::string escrow_pk = test::CompressedPubKeyHex(test::ESCROW_SK);
    std::string receiver_pk = test::CompressedPubKeyHex(test::RECEIVER_SK);

    std::string seller_address = coder.Encode(test::TaprootKeyPathScript(seller_pk));
    std::string buyer_address = coder.Encode(test::TaprootKeyPathScript(buyer_pk));
    std::string receive_address = coder.Encode(test::TaprootKeyPathScript(receiver_pk));

    std::shared_ptr<test::MockDataSource> datasource = std::make_shared<test::MockDataSource>();

    std::string AddInscription(char txid_char, uint32_t vout)
    {
        std::string id = std::string(64, txid_char) + "i" + std::to_string(vout);
        UTXO utxo {std::string(64, txid_char), vout, INSCRIPTION_VALUE, coder.Decode(seller_address), seller_address};
        datasource->AddInscription(id, utxo, seller_address);
        return id;
    }

    void FundBuyer(const std::string& address, const CScript& script, std::vector<CAmount> values)
    {
        uint32_t n = 0;
        for (CAmount value: values) {
            datasource->unspents[address].push_back({std::string(64, 'f'), n++, value, script, address});
        }
    }

    std::string SellerPSBT(const std::string& inscription_id, CAmount price = PRICE)
    {
        return EncodePsbtBase64(ProtectedPurchaseBuilder::CreateInscriptionPSBT(
                inscription_id, seller_pk, seller_address, seller_address, price, escrow_pk, *datasource, NETWORK, CHAIN));
    }

    ProtectedPurchaseBuilder Builder(const std::vector<std::string>& psbts, const std::string& buyer_addr, CAmount fee_rate_sat_vb = 8)
    {
        ProtectedPurchaseBuilder builder(NETWORK, CHAIN, datasource);
        builder.EscrowPubKey(escrow_pk)
               .InscriptionPSBTs(psbts)
               .BuyerAddress(buyer_addr)
               .BuyerPubKey(buyer_pk)
               .ReceiveAddress(receive_address)
               .EffectiveFeeRate(CFeeRate(fee_rate_sat_vb * 1000));
        return builder;
    }
};

}

TEST_CASE_METHOD(PurchaseFixture, "Seller inscription PSBT")
{
    std::string id = AddInscription('a', 0);
    PartiallySignedTransaction psbt = DecodePsbt(SellerPSBT(id));

    const CMutableTransaction& tx = GetUnsignedTx(psbt);
    REQUIRE(tx.vin.size() == 1);
    REQUIRE(tx.vout.size() == 2);

    CHECK(FormatOutpoint(tx.vin[0].prevout) == std::string(64, 'a') + ":0");
    CHECK(psbt.inputs[0].sighash_type == (SIGHASH_ALL | SIGHASH_ANYONECANPAY));
    CHECK(psbt.inputs[0].witness_utxo.nValue == INSCRIPTION_VALUE);

    EscrowAddress escrow = GetEscrowAddress(FormatOutpoint(tx.vin[0].prevout), escrow_pk, NETWORK, CHAIN);
    CHECK(tx.vout[0].scriptPubKey == coder.Decode(escrow.address));
    CHECK(tx.vout[0].nValue == INSCRIPTION_VALUE);
    CHECK(tx.vout[1].scriptPubKey == coder.Decode(seller_address));
    CHECK(tx.vout[1].nValue == PRICE);

    CHECK_THROWS_AS(SellerPSBT(std::string(64, 'b') + "i0"), InscriptionNotFound);
    CHECK_THROWS_AS(ProtectedPurchaseBuilder::CreateInscriptionPSBT(id, seller_pk, buyer_address, seller_address, PRICE, escrow_pk, *datasource, NETWORK, CHAIN),
                    InscriptionOwnershipMismatch);
    CHECK_THROWS_AS(SellerPSBT(id, 0), InputError);
}

TEST_CASE_METHOD(PurchaseFixture, "Purchase of two inscriptions")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0)), SellerPSBT(AddInscription('b', 1))};
    FundBuyer(buyer_address, coder.Decode(buyer_address), {150000, 120000, 5000});

    std::string extra_address = coder.Encode(test::WitnessKeyHashScript(receiver_pk));

    ProtectedPurchaseBuilder builder = Builder(psbts, buyer_address);
    builder.ExtraOutputs({{extra_address, 1000}}).Verbose(true);

    BuildTransactionsResponse response;
    REQUIRE_NOTHROW(response = builder.BuildTransactions("purchase-1"));

    PartiallySignedTransaction first = DecodePsbt(response.first_transaction_psbt_base64);
    REQUIRE(response.second_transaction_psbt_base64.size() == 2);
    PartiallySignedTransaction third = DecodePsbt(response.third_transaction_psbt_base64);

    CommitmentAddress commitment = CommitmentAddressBuilder(NETWORK, CHAIN).BuildBuyerAddress(buyer_pk, buyer_address, "purchase-1");

    const CMutableTransaction& first_tx = GetUnsignedTx(first);
    uint256 first_txid = GetTxid(first);

    // Two inscription fundings and CPFP funding, optionally followed by change
    REQUIRE(first_tx.vout.size() >= 3);
    REQUIRE(first_tx.vout.size() <= 4);
    for (size_t i = 0; i < 3; ++i) {
        CHECK(first_tx.vout[i].scriptPubKey == commitment.script_pubkey);
    }
    if (first_tx.vout.size() == 4) {
        CHECK(first_tx.vout[3].scriptPubKey == coder.Decode(buyer_address));
    }

    size_t total_vbytes = GetVBytes(first);
    CAmount total_fees = GetTotalFees(first);
    CHECK(total_fees >= 0);

    for (size_t i = 0; i < 2; ++i) {
        PartiallySignedTransaction second = DecodePsbt(response.second_transaction_psbt_base64[i]);
        const CMutableTransaction& second_tx = GetUnsignedTx(second);

        REQUIRE(second_tx.vin.size() == 2);
        REQUIRE(second_tx.vout.size() == 2);
        CHECK(second_tx.vin[1].prevout == COutPoint(first_txid, i));
        CHECK(second.inputs[0].sighash_type == (SIGHASH_ALL | SIGHASH_ANYONECANPAY));
        CHECK(second.inputs[1].sighash_type == SIGHASH_ALL);
        CHECK(second.inputs[1].m_tap_internal_key == XOnlyPubKey(commitment.internal_key));
        CHECK(second.inputs[1].m_tap_merkle_root == commitment.merkle_root);
        CHECK(second_tx.vout[1].nValue == PRICE);

        CAmount fee = GetTotalFees(second);
        CHECK(fee >= 0);
        total_fees += fee;
        total_vbytes += GetVBytes(second);

        const CTxIn& escrow_in = GetUnsignedTx(third).vin[i];
        CHECK(escrow_in.prevout == COutPoint(GetTxid(second), 0));
        CHECK(third.inputs[i].sighash_type == SIGHASH_ALL);
        CHECK(third.inputs[i].m_tap_internal_key == XOnlyPubKey(TaprootKeys(escrow_pk).GetPubKey()));
    }

    const CMutableTransaction& third_tx = GetUnsignedTx(third);
    REQUIRE(third_tx.vin.size() == 3);
    REQUIRE(third_tx.vout.size() == 3);
    CHECK(third_tx.vin[2].prevout == COutPoint(first_txid, 2));
    CHECK(third.inputs[2].m_tap_merkle_root == commitment.merkle_root);
    CHECK(third_tx.vout[0].scriptPubKey == coder.Decode(receive_address));
    CHECK(third_tx.vout[0].nValue == INSCRIPTION_VALUE);
    CHECK(third_tx.vout[1].nValue == INSCRIPTION_VALUE);
    CHECK(third_tx.vout[2].scriptPubKey == coder.Decode(extra_address));
    CHECK(third_tx.vout[2].nValue == 1000);

    CAmount third_fee = GetTotalFees(third);
    CHECK(third_fee >= 0);
    total_fees += third_fee;
    total_vbytes += GetVBytes(third);

    std::clog << "Chain: " << total_vbytes << " vB, fees " << total_fees << " sat" << std::endl;

    // The whole chain pays at least the effective rate, with no more than the CPFP seed above it
    CHECK(total_fees >= CFeeRate(8000).GetFee(total_vbytes));
    CHECK(total_fees <= CFeeRate(8000).GetFee(total_vbytes) + ProtectedPurchaseBuilder::INITIAL_CPFP_FUNDING);

    CHECK(datasource->unspents_requests.load() == 1);
}

TEST_CASE_METHOD(PurchaseFixture, "Unique id drives the commitment address")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};
    FundBuyer(buyer_address, coder.Decode(buyer_address), {200000});

    ProtectedPurchaseBuilder builder = Builder(psbts, buyer_address);

    BuildTransactionsResponse r1 = builder.BuildTransactions("id-1");
    BuildTransactionsResponse r2 = builder.BuildTransactions("id-1");
    BuildTransactionsResponse r3 = builder.BuildTransactions("id-2");

    CHECK(r1.first_transaction_psbt_base64 == r2.first_transaction_psbt_base64);
    CHECK(r1.third_transaction_psbt_base64 == r2.third_transaction_psbt_base64);

    CScript commitment1 = GetUnsignedTx(DecodePsbt(r1.first_transaction_psbt_base64)).vout[0].scriptPubKey;
    CScript commitment3 = GetUnsignedTx(DecodePsbt(r3.first_transaction_psbt_base64)).vout[0].scriptPubKey;
    CHECK(commitment1 != commitment3);
}

TEST_CASE_METHOD(PurchaseFixture, "Segwit v0 buyer addresses")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};

    SECTION("p2wpkh")
    {
        CScript script = test::WitnessKeyHashScript(buyer_pk);
        std::string address = coder.Encode(script);
        FundBuyer(address, script, {300000});

        BuildTransactionsResponse response = Builder(psbts, address).BuildTransactions("segwit");
        PartiallySignedTransaction first = DecodePsbt(response.first_transaction_psbt_base64);
        CHECK(first.inputs[0].witness_utxo.scriptPubKey == script);
        CHECK(GetTotalFees(first) >= 0);
    }

    SECTION("p2sh-p2wpkh")
    {
        CScript script = test::NestedWitnessKeyHashScript(buyer_pk);
        std::string address = coder.Encode(script);
        FundBuyer(address, script, {300000});

        BuildTransactionsResponse response = Builder(psbts, address).BuildTransactions("nested");
        PartiallySignedTransaction first = DecodePsbt(response.first_transaction_psbt_base64);
        PartiallySignedTransaction second = DecodePsbt(response.second_transaction_psbt_base64.front());

        CHECK_FALSE(first.inputs[0].redeem_script.empty());
        CHECK(GetUnsignedTx(second).vin[1].prevout.hash == GetTxid(first));
        CHECK(GetUnsignedTx(second).vin[1].prevout.hash != GetUnsignedTx(first).GetHash());
    }
}

TEST_CASE_METHOD(PurchaseFixture, "Missing inscription fails before building")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};
    FundBuyer(buyer_address, coder.Decode(buyer_address), {200000});

    datasource->inscriptions.clear();

    CHECK_THROWS_AS(Builder(psbts, buyer_address).BuildTransactions("x"), InscriptionNotFound);
    CHECK(datasource->unspents_requests.load() == 0);
}

TEST_CASE_METHOD(PurchaseFixture, "One missing inscription fails the whole batch")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0)), SellerPSBT(AddInscription('b', 1))};
    FundBuyer(buyer_address, coder.Decode(buyer_address), {300000});

    datasource->inscriptions.pop_back();

    CHECK_THROWS_AS(Builder(psbts, buyer_address).BuildTransactions("x"), InscriptionNotFound);
    CHECK(datasource->unspents_requests.load() == 0);
}

TEST_CASE_METHOD(PurchaseFixture, "Fee iterations are bounded")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};
    FundBuyer(buyer_address, coder.Decode(buyer_address), {200000});

    auto selector = std::make_shared<NeverFundedSelector>();
    ProtectedPurchaseBuilder builder(NETWORK, CHAIN, datasource, selector);
    builder.EscrowPubKey(escrow_pk)
           .InscriptionPSBTs(psbts)
           .BuyerAddress(buyer_address)
           .BuyerPubKey(buyer_pk)
           .ReceiveAddress(receive_address)
           .EffectiveFeeRate(CFeeRate(8000));

    CHECK_THROWS_AS(builder.BuildTransactions("x"), FeeConvergenceTimeout);
    // one request per inscription funding estimate, then one per round
    CHECK(selector->funding_requests.load() == 1 + ProtectedPurchaseBuilder::MAX_FEE_ITERATIONS);

    CHECK_THROWS_AS(builder.BuildTransactions("x"), ConvergenceError);
}

TEST_CASE_METHOD(PurchaseFixture, "Inscription moved to another owner")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};
    FundBuyer(buyer_address, coder.Decode(buyer_address), {200000});

    datasource->inscriptions.front().owner = buyer_address;

    CHECK_THROWS_AS(Builder(psbts, buyer_address).BuildTransactions("x"), InscriptionOwnershipMismatch);
}

TEST_CASE_METHOD(PurchaseFixture, "Legacy buyer address is rejected before utxo fetch")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};
    std::string legacy = coder.Encode(CScript() << OP_DUP << OP_HASH160 << bytevector(20, 7) << OP_EQUALVERIFY << OP_CHECKSIG);

    CHECK_THROWS_AS(Builder(psbts, legacy).BuildTransactions("x"), InputError);
    CHECK(datasource->unspents_requests.load() == 0);
}

TEST_CASE_METHOD(PurchaseFixture, "Buyer without funds")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};

    SECTION("no utxos")
    {
        CHECK_THROWS_AS(Builder(psbts, buyer_address).BuildTransactions("x"), NoSpendableUtxos);
        CHECK_THROWS_AS(Builder(psbts, buyer_address).BuildTransactions("x"), ResourceError);
    }

    SECTION("not enough")
    {
        FundBuyer(buyer_address, coder.Decode(buyer_address), {20000});
        CHECK_THROWS_AS(Builder(psbts, buyer_address).BuildTransactions("x"), InsufficientFunds);
    }
}

TEST_CASE_METHOD(PurchaseFixture, "Malformed seller PSBTs")
{
    std::string id = AddInscription('a', 0);
    FundBuyer(buyer_address, coder.Decode(buyer_address), {200000});

    PartiallySignedTransaction psbt = DecodePsbt(SellerPSBT(id));

    SECTION("output 0 is not escrow")
    {
        psbt.tx->vout[0].scriptPubKey = coder.Decode(seller_address);
        psbt.outputs[0] = PSBTOutput();
        CHECK_THROWS_AS(Builder({EncodePsbtBase64(psbt)}, buyer_address).BuildTransactions("x"), InvalidSellerPst);
    }

    SECTION("no witness utxo")
    {
        psbt.inputs[0].witness_utxo = CTxOut();
        CHECK_THROWS_AS(Builder({EncodePsbtBase64(psbt)}, buyer_address).BuildTransactions("x"), InvalidSellerPst);
    }

    SECTION("two inputs")
    {
        PSBTInput input;
        input.witness_utxo = CTxOut(1000, coder.Decode(seller_address));
        psbt.AddInput(CTxIn(COutPoint(uint256S(std::string(64, 'e')), 0)), input);
        CHECK_THROWS_AS(Builder({EncodePsbtBase64(psbt)}, buyer_address).BuildTransactions("x"), InvalidSellerPst);
    }
}

TEST_CASE_METHOD(PurchaseFixture, "Builder parameters")
{
    std::vector<std::string> psbts = {SellerPSBT(AddInscription('a', 0))};

    ProtectedPurchaseBuilder builder(NETWORK, CHAIN, datasource);
    CHECK_THROWS_AS(builder.BuildTransactions("x"), InputError);

    CHECK_THROWS_AS(builder.InscriptionPSBTs({"garbage"}), InputError);
    CHECK_THROWS_AS(builder.EscrowPubKey("00"), KeyError);
    CHECK_THROWS_AS(builder.ReceiveAddress("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4"), InputError);
    CHECK_THROWS_AS(builder.EffectiveFeeRate(CFeeRate(0)), InputError);
    CHECK_THROWS_AS(builder.ExtraOutputs({{receive_address, 0}}), InputError);

    CHECK_THROWS_AS(Builder({}, buyer_address).BuildTransactions("x"), InputError);
    CHECK_THROWS_AS(ProtectedPurchaseBuilder(NETWORK, CHAIN, nullptr), InputError);
}

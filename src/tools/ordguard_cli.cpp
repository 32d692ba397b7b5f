#include <cmath>
#include <iostream>
#include <memory>

#include "univalue.h"
#include "util/translation.h"

#include "config.hpp"
#include "address.hpp"
#include "commitment_address.hpp"
#include "json_datasource.hpp"
#include "protected_purchase.hpp"
#include "psbt_utils.hpp"

const std::function<std::string(const char*)> G_TRANSLATION_FUN = nullptr;

using namespace ordguard;

namespace {

std::pair<std::string, CAmount> ParseExtraOutput(const std::string& str)
{
    auto pos = str.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == str.size()) {
        throw InputError("Extra output should be <address>:<sats>: " + str);
    }
    try {
        size_t parsed = 0;
        CAmount amount = std::stoll(str.substr(pos + 1), &parsed);
        if (parsed != str.size() - pos - 1) {
            throw InputError("Extra output amount: " + str);
        }
        return {str.substr(0, pos), amount};
    }
    catch (const std::logic_error&) {
        std::throw_with_nested(InputError("Extra output amount: " + str));
    }
}

int EscrowAddressCommand(const ToolOptions& opts)
{
    protection::EscrowAddress escrow = protection::GetEscrowAddress(opts.outpoint, opts.escrow_pk,
                                                                     core::ParseNetwork(opts.mode), core::ParseChain(opts.chain));
    UniValue res(UniValue::VOBJ);
    res.pushKV("address", escrow.address);
    res.pushKV("merkleRoot", escrow.merkle_root);
    std::cout << res.write(2) << std::endl;
    return 0;
}

int InscriptionPsbtCommand(const ToolOptions& opts)
{
    protection::JsonFileDataSource datasource(opts.datasource);
    PartiallySignedTransaction psbt = protection::ProtectedPurchaseBuilder::CreateInscriptionPSBT(
            opts.inscription_id, opts.seller_pk, opts.seller_address, opts.payment_address, opts.price, opts.escrow_pk,
            datasource, core::ParseNetwork(opts.mode), core::ParseChain(opts.chain));

    UniValue res(UniValue::VOBJ);
    res.pushKV("base64", core::EncodePsbtBase64(psbt));
    res.pushKV("hex", core::EncodePsbtHex(psbt));
    std::cout << res.write(2) << std::endl;
    return 0;
}

int BuildCommand(const ToolOptions& opts)
{
    std::vector<std::pair<std::string, CAmount>> extra_outputs;
    for (const auto& out: opts.extra_outputs) {
        extra_outputs.emplace_back(ParseExtraOutput(out));
    }

    protection::ProtectedPurchaseBuilder builder(core::ParseNetwork(opts.mode), core::ParseChain(opts.chain),
                                                 std::make_shared<protection::JsonFileDataSource>(opts.datasource));
    builder.EscrowPubKey(opts.escrow_pk)
           .InscriptionPSBTs(opts.psbts)
           .BuyerAddress(opts.buyer_address)
           .BuyerPubKey(opts.buyer_pk)
           .ReceiveAddress(opts.receive_address)
           .EffectiveFeeRate(CFeeRate(std::llround(opts.fee_rate * 1000)))
           .ExtraOutputs(extra_outputs)
           .Verbose(opts.verbose);

    protection::BuildTransactionsResponse response = builder.BuildTransactions(opts.unique_id);

    UniValue seconds(UniValue::VARR);
    for (const auto& psbt: response.second_transaction_psbt_base64) {
        seconds.push_back(psbt);
    }

    UniValue res(UniValue::VOBJ);
    res.pushKV("firstTransactionPSBTBase64", response.first_transaction_psbt_base64);
    res.pushKV("secondTransactionPSBTBase64", seconds);
    res.pushKV("thirdTransactionPSBTBase64", response.third_transaction_psbt_base64);
    std::cout << res.write(2) << std::endl;
    return 0;
}

}

int main(int argc, char* argv[])
{
    Config config;
    if (auto exit_code = config.ProcessConfig(argc, argv)) {
        return *exit_code;
    }

    try {
        const ToolOptions& opts = config.Options();
        if (config.GotSubcommand(config::ESCROW_ADDRESS)) return EscrowAddressCommand(opts);
        if (config.GotSubcommand(config::INSCRIPTION_PSBT)) return InscriptionPsbtCommand(opts);
        if (config.GotSubcommand(config::BUILD)) return BuildCommand(opts);
    }
    catch (const std::exception&) {
        print_error(std::cerr);
        return 1;
    }
    return 1;
}

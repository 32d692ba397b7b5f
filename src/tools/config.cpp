#include <iostream>

#include "config.hpp"

namespace ordguard {

namespace config {

const char * const ESCROW_ADDRESS = "escrow-address";
const char * const INSCRIPTION_PSBT = "inscription-psbt";
const char * const BUILD = "build";

namespace option {

const char * const CONF = "--conf";
const char * const CHAINMODE = "--mode";
const char * const CHAIN = "--chain";
const char * const VERBOSE = "--verbose";
const char * const DATASOURCE = "--datasource";
const char * const OUTPOINT = "--outpoint";
const char * const ESCROW_PK = "--escrow-pk";
const char * const INSCRIPTION_ID = "--inscription-id";
const char * const SELLER_PK = "--seller-pk";
const char * const SELLER_ADDRESS = "--seller-address";
const char * const PAYMENT_ADDRESS = "--payment-address";
const char * const PRICE = "--price";
const char * const PSBT = "--psbt";
const char * const BUYER_ADDRESS = "--buyer-address";
const char * const BUYER_PK = "--buyer-pk";
const char * const RECEIVE_ADDRESS = "--receive-address";
const char * const FEE_RATE = "--fee-rate";
const char * const UNIQUE_ID = "--unique-id";
const char * const EXTRA_OUTPUT = "--extra-output";

namespace mode {
    const char * const MAINNET = "mainnet";
    const char * const TESTNET = "testnet";
    const char * const SIGNET = "signet";
    const char * const REGTEST = "regtest";
}

namespace chain {
    const char * const BITCOIN = "bitcoin";
    const char * const FRACTAL = "fractal-bitcoin";
}

}

}

using namespace ::ordguard::config;

Config::Config():m_app(PACKAGE_NAME, PACKAGE_NAME)
{
    m_app.set_config(option::CONF, "ordguard.conf", "Read the configuration file");
    m_app.set_version_flag("--version", PACKAGE_STRING);
    m_app.set_help_flag("--help,-h");
    m_app.require_subcommand(1);

    m_app.add_option(option::CHAINMODE, m_options.mode, "Network to operate: mainnet, testnet, signet, regtest")
            ->check(CLI::IsMember({option::mode::MAINNET, option::mode::TESTNET, option::mode::SIGNET, option::mode::REGTEST}))
            ->capture_default_str();
    m_app.add_option(option::CHAIN, m_options.chain, "Chain: bitcoin, fractal-bitcoin")
            ->check(CLI::IsMember({option::chain::BITCOIN, option::chain::FRACTAL}))
            ->capture_default_str();
    m_app.add_flag(option::VERBOSE, m_options.verbose, "Log fee iterations and built transactions to stderr");

    //-------------------------------------------------------------------------
    // escrow-address
    {
        auto escrow = m_app.add_subcommand(ESCROW_ADDRESS, "Print escrow address and merkle root for an inscription outpoint");
        escrow->add_option(option::OUTPOINT, m_options.outpoint, "Inscription outpoint <txid>:<vout>")->required();
        escrow->add_option(option::ESCROW_PK, m_options.escrow_pk, "Escrow public key hex")->required()->configurable(true);
    }

    //-------------------------------------------------------------------------
    // inscription-psbt
    {
        auto inscription = m_app.add_subcommand(INSCRIPTION_PSBT, "Create seller PSBT moving an inscription to escrow");
        inscription->add_option(option::DATASOURCE, m_options.datasource, "Datasource JSON file")->required()->check(CLI::ExistingFile)->configurable(true);
        inscription->add_option(option::INSCRIPTION_ID, m_options.inscription_id, "Inscription id")->required();
        inscription->add_option(option::SELLER_PK, m_options.seller_pk, "Seller public key hex")->required();
        inscription->add_option(option::SELLER_ADDRESS, m_options.seller_address, "Seller address holding the inscription")->required();
        inscription->add_option(option::PAYMENT_ADDRESS, m_options.payment_address, "Address receiving the price")->required();
        inscription->add_option(option::PRICE, m_options.price, "Price in sats")->required()->check(CLI::PositiveNumber);
        inscription->add_option(option::ESCROW_PK, m_options.escrow_pk, "Escrow public key hex")->required()->configurable(true);
    }

    //-------------------------------------------------------------------------
    // build
    {
        auto build = m_app.add_subcommand(BUILD, "Build the protected purchase transaction chain");
        build->add_option(option::DATASOURCE, m_options.datasource, "Datasource JSON file")->required()->check(CLI::ExistingFile)->configurable(true);
        build->add_option(option::PSBT, m_options.psbts, "Seller signed inscription PSBT (base64 or hex), repeatable")->required();
        build->add_option(option::ESCROW_PK, m_options.escrow_pk, "Escrow public key hex")->required()->configurable(true);
        build->add_option(option::BUYER_ADDRESS, m_options.buyer_address, "Buyer funding address")->required();
        build->add_option(option::BUYER_PK, m_options.buyer_pk, "Buyer public key hex")->required();
        build->add_option(option::RECEIVE_ADDRESS, m_options.receive_address, "Address receiving the inscriptions")->required();
        build->add_option(option::FEE_RATE, m_options.fee_rate, "Effective fee rate for the whole chain, sat/vB")->required()->check(CLI::PositiveNumber);
        build->add_option(option::UNIQUE_ID, m_options.unique_id, "Unique purchase id committed into the buyer address")->required();
        build->add_option(option::EXTRA_OUTPUT, m_options.extra_outputs, "Extra withdraw output <address>:<sats>, repeatable");
    }
}

}

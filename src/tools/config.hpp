#pragma once

#include <optional>

#include "CLI/CLI.hpp"
#include "common.hpp"

namespace ordguard {

namespace config {

extern const char* const ESCROW_ADDRESS;
extern const char* const INSCRIPTION_PSBT;
extern const char* const BUILD;

namespace option {

extern const char* const CONF;
extern const char* const CHAINMODE;
extern const char* const CHAIN;
extern const char* const VERBOSE;
extern const char* const DATASOURCE;
extern const char* const OUTPOINT;
extern const char* const ESCROW_PK;
extern const char* const INSCRIPTION_ID;
extern const char* const SELLER_PK;
extern const char* const SELLER_ADDRESS;
extern const char* const PAYMENT_ADDRESS;
extern const char* const PRICE;
extern const char* const PSBT;
extern const char* const BUYER_ADDRESS;
extern const char* const BUYER_PK;
extern const char* const RECEIVE_ADDRESS;
extern const char* const FEE_RATE;
extern const char* const UNIQUE_ID;
extern const char* const EXTRA_OUTPUT;

} // namespace ordguard::config::option

} // namespace ordguard::config

struct ToolOptions
{
    std::string mode = "mainnet";
    std::string chain = "bitcoin";
    bool verbose = false;

    std::string datasource;
    std::string outpoint;
    std::string escrow_pk;

    std::string inscription_id;
    std::string seller_pk;
    std::string seller_address;
    std::string payment_address;
    int64_t price = 0;

    stringvector psbts;
    std::string buyer_address;
    std::string buyer_pk;
    std::string receive_address;
    double fee_rate = 0; // sat/vB
    std::string unique_id;
    stringvector extra_outputs; // address:sats
};

class Config {
private:
    CLI::App m_app;
    ToolOptions m_options;

public:
    explicit Config();
    ~Config() = default;

    // Returns exit code when parsing has finished the run (help, version or error)
    std::optional<int> ProcessConfig(const std::vector<std::string>& args)
    {
        try {
            stringvector reversed(args.rbegin(), args.rend());
            m_app.parse(reversed);
        }
        catch(const CLI::ParseError &e) {
            return m_app.exit(e);
        }
        return {};
    }

    std::optional<int> ProcessConfig(int argc, const char* const argv[])
    {
        try {
            m_app.parse(argc, argv);
        }
        catch(const CLI::ParseError &e) {
            return m_app.exit(e);
        }
        return {};
    }

    bool GotSubcommand(const char* const name) const
    { return m_app.got_subcommand(name); }

    const ToolOptions& Options() const
    { return m_options; }
};

} // namespace ordguard

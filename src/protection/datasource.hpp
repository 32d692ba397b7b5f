#pragma once

#include <optional>
#include <string>
#include <vector>

#include "consensus/amount.h"
#include "script/script.h"

#include "common.hpp"

namespace ordguard::protection {

struct UTXO
{
    std::string txid;
    uint32_t vout = 0;
    CAmount value = 0;
    CScript script_pubkey;
    std::string address;
};

struct InscriptionRecord
{
    std::string id;
    std::string outpoint;
    std::string owner;
    std::string media_type;
};

struct UnspentsQuery
{
    std::string address;
    stringvector rarity;
    std::string type = "spendable";
    std::string sort = "desc";
};

struct UnspentsResponse
{
    std::vector<UTXO> spendable;
    std::vector<UTXO> unspendable;
    size_t total_count = 0;
};

// Blockchain index facade. Implementations must allow concurrent calls.
class IDataSource
{
public:
    virtual ~IDataSource() = default;

    virtual UnspentsResponse GetUnspents(const UnspentsQuery& query) const = 0;
    virtual std::vector<InscriptionRecord> GetInscriptions(const std::string& outpoint) const = 0;
    virtual std::optional<UTXO> GetInscriptionUTXO(const std::string& inscription_id) const = 0;
};

}

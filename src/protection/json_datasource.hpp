#pragma once

#include <map>
#include <string>

#include "univalue.h"

#include "datasource.hpp"

namespace ordguard::protection {

struct StoredUTXO
{
    UTXO utxo;
    bool safe_to_spend = true;
    std::string rarity = "common";
};

// Read-only data source over a JSON snapshot of the indexer state
class JsonFileDataSource : public IDataSource
{
    std::map<std::string, std::vector<StoredUTXO>> m_unspents;
    std::vector<InscriptionRecord> m_inscriptions;

    void Load(const UniValue& data);

public:
    static const std::string name_unspents;
    static const std::string name_inscriptions;

    explicit JsonFileDataSource(const std::string& path);
    explicit JsonFileDataSource(const UniValue& data) { Load(data); }

    UnspentsResponse GetUnspents(const UnspentsQuery& query) const override;
    std::vector<InscriptionRecord> GetInscriptions(const std::string& outpoint) const override;
    std::optional<UTXO> GetInscriptionUTXO(const std::string& inscription_id) const override;
};

}

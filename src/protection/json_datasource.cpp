#include "json_datasource.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "uint256.h"
#include "util/strencodings.h"

#include "psbt_utils.hpp"

namespace ordguard::protection {

const std::string JsonFileDataSource::name_unspents = "unspents";
const std::string JsonFileDataSource::name_inscriptions = "inscriptions";

namespace {

const std::string& GetString(const UniValue& obj, const std::string& key)
{
    const UniValue& val = obj[key];
    if (!val.isStr()) {
        throw InputError("Datasource field is not a string: " + key);
    }
    return val.get_str();
}

StoredUTXO ParseUTXO(const UniValue& val)
{
    if (!val.isObject()) {
        throw InputError("Datasource utxo is not an object");
    }

    StoredUTXO res;
    res.utxo.txid = ToLower(GetString(val, "txid"));
    res.utxo.vout = val["n"].getInt<uint32_t>();
    res.utxo.value = val["sats"].getInt<int64_t>();

    const UniValue& script = val["scriptPubKey"];
    if (!script.isObject()) {
        throw InputError("Datasource utxo has no scriptPubKey: " + res.utxo.txid);
    }
    bytevector script_bytes = unhex<bytevector>(GetString(script, "hex"));
    res.utxo.script_pubkey = CScript(script_bytes.begin(), script_bytes.end());
    res.utxo.address = GetString(script, "address");

    const UniValue& safe = val["safeToSpend"];
    if (safe.isBool()) {
        res.safe_to_spend = safe.get_bool();
    }
    const UniValue& rarity = val["rarity"];
    if (rarity.isStr()) {
        res.rarity = rarity.get_str();
    }
    return res;
}

}

JsonFileDataSource::JsonFileDataSource(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        throw InputError("Cannot open datasource file: " + path);
    }
    std::stringstream buf;
    buf << file.rdbuf();

    UniValue data;
    if (!data.read(buf.str())) {
        throw InputError("Datasource file is not a valid JSON: " + path);
    }
    Load(data);
}

void JsonFileDataSource::Load(const UniValue& data)
{
    if (!data.isObject()) {
        throw InputError("Datasource root is not an object");
    }

    try {
        const UniValue& unspents = data[name_unspents];
        if (unspents.isObject()) {
            for (const auto& address: unspents.getKeys()) {
                auto& utxos = m_unspents[address];
                for (const auto& utxo: unspents[address].getValues()) {
                    utxos.emplace_back(ParseUTXO(utxo));
                }
            }
        }

        const UniValue& inscriptions = data[name_inscriptions];
        if (inscriptions.isArray()) {
            for (const auto& val: inscriptions.getValues()) {
                InscriptionRecord rec;
                rec.id = GetString(val, "id");
                rec.outpoint = core::FormatOutpoint(core::ParseOutpoint(GetString(val, "outpoint")));
                rec.owner = GetString(val, "owner");
                if (val["mediaType"].isStr()) {
                    rec.media_type = val["mediaType"].get_str();
                }
                m_inscriptions.emplace_back(move(rec));
            }
        }
    }
    catch (const Error&) {
        throw;
    }
    catch (const std::exception&) {
        std::throw_with_nested(InputError("Datasource format"));
    }
}

UnspentsResponse JsonFileDataSource::GetUnspents(const UnspentsQuery& query) const
{
    UnspentsResponse res;

    auto it = m_unspents.find(query.address);
    if (it != m_unspents.end()) {
        for (const auto& stored: it->second) {
            if (!query.rarity.empty() && std::find(query.rarity.begin(), query.rarity.end(), stored.rarity) == query.rarity.end()) {
                continue;
            }
            if (stored.safe_to_spend) {
                res.spendable.push_back(stored.utxo);
            }
            else {
                res.unspendable.push_back(stored.utxo);
            }
        }
    }

    if (query.type == "spendable") {
        res.unspendable.clear();
    }

    auto by_value = [desc = (query.sort != "asc")](const UTXO& a, const UTXO& b) {
        return desc ? a.value > b.value : a.value < b.value;
    };
    std::stable_sort(res.spendable.begin(), res.spendable.end(), by_value);
    std::stable_sort(res.unspendable.begin(), res.unspendable.end(), by_value);

    res.total_count = res.spendable.size() + res.unspendable.size();
    return res;
}

std::vector<InscriptionRecord> JsonFileDataSource::GetInscriptions(const std::string& outpoint) const
{
    std::string normalized = core::FormatOutpoint(core::ParseOutpoint(outpoint));
    std::vector<InscriptionRecord> res;
    std::copy_if(m_inscriptions.begin(), m_inscriptions.end(), std::back_inserter(res),
                 [&normalized](const InscriptionRecord& rec) { return rec.outpoint == normalized; });
    return res;
}

std::optional<UTXO> JsonFileDataSource::GetInscriptionUTXO(const std::string& inscription_id) const
{
    auto rec = std::find_if(m_inscriptions.begin(), m_inscriptions.end(),
                            [&inscription_id](const InscriptionRecord& r) { return r.id == inscription_id; });
    if (rec == m_inscriptions.end()) {
        return {};
    }

    COutPoint outpoint = core::ParseOutpoint(rec->outpoint);
    for (const auto& [address, utxos]: m_unspents) {
        for (const auto& stored: utxos) {
            if (stored.utxo.vout == outpoint.n && uint256S(stored.utxo.txid) == outpoint.hash) {
                return stored.utxo;
            }
        }
    }
    return {};
}

}

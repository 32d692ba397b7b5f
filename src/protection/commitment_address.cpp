#include "commitment_address.hpp"

#include "inscription_common.hpp"
#include "psbt_utils.hpp"
#include "script_merkle_tree.hpp"
#include "taproot_keys.hpp"

namespace ordguard::protection {

const std::string CommitmentAddressBuilder::name_buyer_pk = "buyerPublicKey";
const std::string CommitmentAddressBuilder::name_buyer_address = "buyerAddress";
const std::string CommitmentAddressBuilder::name_unique_id = "uniqueId";
const std::string CommitmentAddressBuilder::name_inscription_outpoint = "inscriptionOutpoint";

CScript MakeInscriptionScript(const xonly_pubkey& pk, const std::string& content_type, const bytevector& data)
{
    CScript script;
    script << pk;
    script << OP_CHECKSIG;
    script << OP_0;
    script << OP_IF;
    script << ORD_TAG;
    script << CONTENT_TYPE_TAG;
    script << bytevector(content_type.begin(), content_type.end());

    script << CONTENT_TAG;
    auto pos = data.begin();
    for ( ; pos + chunk_size < data.end(); pos += chunk_size) {
        script << bytevector(pos, pos + chunk_size);
    }
    if (pos != data.end()) {
        script << bytevector(pos, data.end());
    }

    script << OP_ENDIF;

    return script;
}

CommitmentAddress CommitmentAddressBuilder::Build(const std::string& pubkey_hex, const UniValue& payload) const
{
    try {
        core::TaprootKeys key(pubkey_hex);

        std::string json = payload.write();

        CScript key_spend_script;
        key_spend_script << key.GetPubKey() << OP_CHECKSIG;

        ScriptMerkleTree tree({key_spend_script, MakeInscriptionScript(key.GetPubKey(), JSON_CONTENT_TYPE, bytevector(json.begin(), json.end()))});

        CommitmentAddress res;
        res.internal_key = key.GetPubKey();
        res.merkle_root = tree.CalculateRoot();

        auto tweaked = key.AddTapTweak(res.merkle_root);
        res.script_pubkey = core::MakeTaprootScript(tweaked.first);
        res.address = m_coder.Encode(res.script_pubkey);
        return res;
    }
    catch (const Error&) {
        std::throw_with_nested(AddressConstructionError("Commitment address for key " + pubkey_hex));
    }
}

CommitmentAddress CommitmentAddressBuilder::BuildBuyerAddress(const std::string& buyer_pk, const std::string& buyer_address, const std::string& unique_id) const
{
    UniValue payload(UniValue::VOBJ);
    payload.pushKV(name_buyer_pk, buyer_pk);
    payload.pushKV(name_buyer_address, buyer_address);
    payload.pushKV(name_unique_id, unique_id);
    return Build(buyer_pk, payload);
}

CommitmentAddress CommitmentAddressBuilder::BuildEscrowAddress(const COutPoint& inscription_outpoint, const std::string& escrow_pk) const
{
    UniValue payload(UniValue::VOBJ);
    payload.pushKV(name_inscription_outpoint, core::FormatOutpoint(inscription_outpoint));
    return Build(escrow_pk, payload);
}

EscrowAddress GetEscrowAddress(const std::string& inscription_outpoint, const std::string& escrow_pk, core::Network network, core::Chain chain)
{
    CommitmentAddress commitment = CommitmentAddressBuilder(network, chain).BuildEscrowAddress(core::ParseOutpoint(inscription_outpoint), escrow_pk);
    return {commitment.address, hex(commitment.merkle_root)};
}

}

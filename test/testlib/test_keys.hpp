#pragma once

#include <string>

#include "secp256k1.h"
#include "secp256k1_extrakeys.h"

#include "common.hpp"
#include "address.hpp"
#include "taproot_keys.hpp"

namespace ordguard::test {

inline const secp256k1_context* SigningContext()
{
    static secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    return ctx;
}

inline std::string CompressedPubKeyHex(const std::string& sk_hex)
{
    bytevector sk = unhex<bytevector>(sk_hex);
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(SigningContext(), &pubkey, sk.data())) {
        throw KeyError("test key " + sk_hex);
    }
    bytevector out(33);
    size_t len = out.size();
    secp256k1_ec_pubkey_serialize(SigningContext(), out.data(), &len, &pubkey, SECP256K1_EC_COMPRESSED);
    return hex(out);
}

inline std::string XOnlyPubKeyHex(const std::string& sk_hex)
{
    return CompressedPubKeyHex(sk_hex).substr(2);
}

inline CScript TaprootKeyPathScript(const std::string& pk_hex)
{
    return core::MakeTaprootScript(core::TaprootKeys(pk_hex).AddTapTweak(std::nullopt).first);
}

inline CScript WitnessKeyHashScript(const std::string& pk_hex)
{
    return core::MakeWitnessV0KeyHashScript(core::TaprootKeys(pk_hex).GetCompressedPubKey());
}

inline CScript NestedWitnessKeyHashScript(const std::string& pk_hex)
{
    return core::MakeScriptHashScript(core::MakeNestedWitnessRedeemScript(core::TaprootKeys(pk_hex).GetCompressedPubKey()));
}

const std::string SELLER_SK = "1111111111111111111111111111111111111111111111111111111111111111";
const std::string BUYER_SK = "2222222222222222222222222222222222222222222222222222222222222222";
const std::string ESCROW_SK = "3333333333333333333333333333333333333333333333333333333333333333";
const std::string RECEIVER_SK = "4444444444444444444444444444444444444444444444444444444444444444";

}

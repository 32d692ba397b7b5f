#include "taproot_keys.hpp"
#include "hash_helper.hpp"

#include <mutex>
#include <atomic>

namespace ordguard::core {

namespace {

std::atomic<secp256k1_context*> ctx = nullptr;
std::mutex ctx_mutex;

}

secp256k1_context *TaprootKeys::GetStaticSecp256k1Context()
{
    secp256k1_context* res = ctx.load();
    if (!res) {
        std::lock_guard lock(ctx_mutex);
        res = ctx.load();
        if (!res) {
            res = secp256k1_context_create(SECP256K1_CONTEXT_VERIFY);
            ctx = res;
        }
    }
    return res;
}

TaprootKeys::TaprootKeys(const std::string& pubkey_hex) : m_ctx(GetStaticSecp256k1Context())
{
    bytevector pubkey_bytes = unhex<bytevector>(pubkey_hex);

    if (pubkey_bytes.size() == 33) {
        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_parse(m_ctx, &pubkey, pubkey_bytes.data(), pubkey_bytes.size())) {
            throw KeyError("Invalid compressed public key: " + pubkey_hex);
        }
        secp256k1_xonly_pubkey xonly;
        if (!secp256k1_xonly_pubkey_from_pubkey(m_ctx, &xonly, nullptr, &pubkey)) {
            throw KeyError("x-only conversion: " + pubkey_hex);
        }
        m_pk.set(m_ctx, xonly);
        m_compressed_pk.emplace(pubkey_bytes);
    }
    else if (pubkey_bytes.size() == 32) {
        xonly_pubkey pk(move(pubkey_bytes));
        pk.get(m_ctx); // validates the point
        m_pk = move(pk);
    }
    else {
        throw KeyError("Wrong public key length: " + pubkey_hex);
    }
}

TaprootKeys::TaprootKeys(const xonly_pubkey& pk) : m_ctx(GetStaticSecp256k1Context()), m_pk(pk)
{
    m_pk.get(m_ctx);
}

const compressed_pubkey& TaprootKeys::GetCompressedPubKey() const
{
    if (!m_compressed_pk) {
        throw KeyError("Compressed public key is not available for x-only key " + hex(m_pk));
    }
    return *m_compressed_pk;
}

std::pair<xonly_pubkey, uint8_t> TaprootKeys::AddTapTweak(const xonly_pubkey& pk, const std::optional<uint256>& merkle_root)
{
    const secp256k1_context* secp_ctx = GetStaticSecp256k1Context();

    HashWriter hash(TAPTWEAK_HASH);
    hash.write(MakeByteSpan(pk));
    if (merkle_root.has_value()) {
        hash << *merkle_root;
    }
    uint256 tweak = hash.GetHash();

    secp256k1_xonly_pubkey base_pk = pk.get(secp_ctx);
    secp256k1_pubkey tweaked_full_pk;
    if (!secp256k1_xonly_pubkey_tweak_add(secp_ctx, &tweaked_full_pk, &base_pk, tweak.data())) {
        throw KeyError("Tap tweak");
    }

    secp256k1_xonly_pubkey tweaked_pk;
    int parity = -1;
    if (!secp256k1_xonly_pubkey_from_pubkey(secp_ctx, &tweaked_pk, &parity, &tweaked_full_pk)) {
        throw KeyError("Tweaked x-only conversion");
    }

    return std::make_pair(xonly_pubkey(secp_ctx, tweaked_pk), static_cast<uint8_t>(parity));
}

}

#include <iostream>

#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include "util/translation.h"
#include "util/strencodings.h"
#include "script/interpreter.h"
#include "pubkey.h"

#include "secp256k1_extrakeys.h"

#include "hash_helper.hpp"
#include "script_merkle_tree.hpp"
#include "taproot_keys.hpp"
#include "common.hpp"

#include "../testlib/test_keys.hpp"

using namespace ordguard;
using namespace ordguard::core;

const std::function<std::string(const char*)> G_TRANSLATION_FUN = nullptr;

static const CScript TestScript = CScript() << ParseHex("db1ff3f207771e90ec30747525abaefd3b56ff2b3aecbb76809b7106617c442e") << OP_CHECKSIG;
static const CScript TestScript2 = CScript() << ParseHex("e46a6fd2ad0e59d2e05e2b6cb54cc3c2c8b52d5c09ca00d0e1f0d7c0a93ffa04") << OP_CHECKSIG << OP_0 << OP_DROP;

TEST_CASE("TapLeaf hash")
{
    uint256 bitcoin_hash = ComputeTapleafHash(TAPLEAF_VERSION, TestScript);
    uint256 result_hash = TapLeafHash(TestScript);

    std::clog << "TapLeaf hash: " << result_hash.GetHex() << std::endl;

    CHECK(result_hash == bitcoin_hash);
}

static uint256 ReferenceTapBranch(uint256 a, uint256 b)
{
    static const std::string tag = "TapBranch";
    uint256 taghash;
    CSHA256().Write((const uint8_t*)tag.data(), tag.size()).Finalize(taghash.data());

    if (b < a) std::swap(a, b);

    uint256 res;
    CSHA256()
            .Write(taghash.data(), taghash.size())
            .Write(taghash.data(), taghash.size())
            .Write(a.data(), a.size())
            .Write(b.data(), b.size())
            .Finalize(res.data());
    return res;
}

TEST_CASE("TapBranch hash is order independent")
{
    uint256 leaf1 = TapLeafHash(TestScript);
    uint256 leaf2 = TapLeafHash(TestScript2);

    CHECK(TapBranchHash(leaf1, leaf2) == TapBranchHash(leaf2, leaf1));
    CHECK(TapBranchHash(leaf1, leaf2) == ReferenceTapBranch(leaf1, leaf2));
}

TEST_CASE("Two leaf tree")
{
    ScriptMerkleTree tree({TestScript, TestScript2});

    uint256 root = tree.CalculateRoot();
    CHECK(root == ReferenceTapBranch(ComputeTapleafHash(TAPLEAF_VERSION, TestScript), ComputeTapleafHash(TAPLEAF_VERSION, TestScript2)));

    CHECK(ScriptMerkleTree({TestScript2, TestScript}).CalculateRoot() == root);
    CHECK_THROWS_AS(ScriptMerkleTree().CalculateRoot(), InputError);
}

TEST_CASE("TapTweak")
{
    TaprootKeys key(test::CompressedPubKeyHex(test::BUYER_SK));

    HashWriter hash(TAPBRANCH_HASH);
    hash << std::string("test test test");
    uint256 fake_root = hash.GetHash();

    auto taprootkey = key.AddTapTweak(fake_root);

    XOnlyPubKey internal(key.GetPubKey());
    uint256 tweak = internal.ComputeTapTweakHash(&fake_root);

    secp256k1_xonly_pubkey internal_pk = key.GetPubKey().get(key.Secp256k1Context());
    CHECK(secp256k1_xonly_pubkey_tweak_add_check(test::SigningContext(), taprootkey.first.data(), taprootkey.second, &internal_pk, tweak.data()) == 1);

    SECTION("Key path only")
    {
        auto keypath = key.AddTapTweak(std::nullopt);
        uint256 keypath_tweak = internal.ComputeTapTweakHash(nullptr);
        CHECK(secp256k1_xonly_pubkey_tweak_add_check(test::SigningContext(), keypath.first.data(), keypath.second, &internal_pk, keypath_tweak.data()) == 1);
        CHECK(keypath.first != taprootkey.first);
    }
}

TEST_CASE("Public key parsing")
{
    std::string compressed = test::CompressedPubKeyHex(test::SELLER_SK);

    TaprootKeys from_compressed(compressed);
    TaprootKeys from_xonly(compressed.substr(2));

    CHECK(from_compressed.GetPubKey() == from_xonly.GetPubKey());
    CHECK(from_compressed.HasCompressedPubKey());
    CHECK_FALSE(from_xonly.HasCompressedPubKey());
    CHECK_THROWS_AS(from_xonly.GetCompressedPubKey(), KeyError);

    CHECK_THROWS_AS(TaprootKeys("02" + std::string(64, 'z')), InputError);
    CHECK_THROWS_AS(TaprootKeys("0102"), KeyError);
    CHECK_THROWS_AS(TaprootKeys("05" + compressed.substr(2)), KeyError);
}

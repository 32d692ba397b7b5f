#include "script_merkle_tree.hpp"
#include "hash_helper.hpp"
#include "common_error.hpp"


namespace ordguard {

const CSHA256 TAPLEAF_HASH = PrecalculatedTaggedHash("TapLeaf");
const CSHA256 TAPBRANCH_HASH = PrecalculatedTaggedHash("TapBranch");
const CSHA256 TAPTWEAK_HASH = PrecalculatedTaggedHash("TapTweak");

uint256 TapBranchHash(const uint256& a, const uint256& b)
{
    HashWriter writer(TAPBRANCH_HASH);
    if (a < b) {
        writer << a << b;
    } else {
        writer << b << a;
    }
    return writer.GetHash();
}

uint256 TapLeafHash(const CScript &script)
{
    HashWriter writer(TAPLEAF_HASH);
    writer << TAPLEAF_VERSION << script;
    return writer.GetHash();
}

uint256 ScriptMerkleTree::CalculateRoot() const
{
    if (GetScripts().empty()) {
        throw InputError("Empty script tree");
    }

    auto node_it = GetScripts().crbegin();
    uint256 hash = TapLeafHash(*node_it);

    for(++node_it; node_it != GetScripts().crend(); ++node_it)
    {
        hash = TapBranchHash(hash, TapLeafHash(*node_it));
    }

    return hash;
}

}

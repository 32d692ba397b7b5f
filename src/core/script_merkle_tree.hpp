#pragma once

#include <vector>

#include "script/script.h"
#include "uint256.h"

namespace ordguard {

constexpr uint8_t TAPLEAF_VERSION = 0xc0;

uint256 TapLeafHash(const CScript &script);
uint256 TapBranchHash(const uint256& a, const uint256& b);

// Leaves are folded from the last one to the first, so two leaves form a single balanced branch
class ScriptMerkleTree {
    std::vector<CScript> m_scripts;
public:
    explicit ScriptMerkleTree(std::vector<CScript>&& scripts = {}): m_scripts(std::move(scripts)) {}
    ScriptMerkleTree(const ScriptMerkleTree& ) = default;
    ScriptMerkleTree(ScriptMerkleTree&& ) noexcept = default;

    ScriptMerkleTree& operator=(const ScriptMerkleTree& ) = default;
    ScriptMerkleTree& operator=(ScriptMerkleTree&& ) noexcept = default;

    const std::vector<CScript>& GetScripts() const { return m_scripts; }

    uint256 CalculateRoot() const;
};

}

#pragma once

#include <vector>

#include "consensus/amount.h"
#include "policy/feerate.h"
#include "primitives/transaction.h"
#include "psbt.h"

#include "datasource.hpp"

namespace ordguard::protection {

const CAmount DUST_LIMIT = 546;

struct CoinSelection
{
    std::vector<UTXO> inputs;
    std::vector<CTxOut> outputs; // targets in their original order, change appended last
    CAmount fee = 0;
};

class ICoinSelector
{
public:
    virtual ~ICoinSelector() = default;

    virtual CoinSelection Select(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                                 const CFeeRate& fee_rate, const CScript& change_script) const = 0;

    virtual size_t GetVBytes(const PartiallySignedTransaction& psbt) const;

    // Amount the PSBT inputs lack to pay its outputs and the fee at the given rate. Negative means surplus.
    virtual CAmount CalculateFundingAmount(const PartiallySignedTransaction& psbt, const CFeeRate& fee_rate) const;
};

// Blackjack first (inputs matching the targets without change), then accumulative over candidates in order
class AccumulativeCoinSelector : public ICoinSelector
{
    static size_t InputVBytes(const CScript& script_pubkey);
    static size_t OutputVBytes(const CScript& script_pubkey);

    std::optional<CoinSelection> Blackjack(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                                           const CFeeRate& fee_rate, const CScript& change_script) const;
    std::optional<CoinSelection> Accumulative(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                                              const CFeeRate& fee_rate, const CScript& change_script) const;
    CoinSelection Finalize(std::vector<UTXO>&& inputs, const std::vector<CTxOut>& targets,
                           const CFeeRate& fee_rate, const CScript& change_script) const;
public:
    static const size_t TX_OVERHEAD_VBYTES = 11;

    CoinSelection Select(const std::vector<UTXO>& candidates, const std::vector<CTxOut>& targets,
                         const CFeeRate& fee_rate, const CScript& change_script) const override;
};

}

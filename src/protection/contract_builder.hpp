#pragma once

#include <memory>
#include <string>

#include "address.hpp"
#include "coin_selector.hpp"
#include "commitment_address.hpp"
#include "datasource.hpp"

namespace ordguard::protection {

class ContractBuilder
{
protected:
    CommitmentAddressBuilder m_commitment_builder;
    std::shared_ptr<const IDataSource> m_datasource;
    std::shared_ptr<const ICoinSelector> m_coin_selector;
    bool m_verbose = false;

public:
    ContractBuilder(core::Network network, core::Chain chain, std::shared_ptr<const IDataSource> datasource,
                    std::shared_ptr<const ICoinSelector> coin_selector = std::make_shared<AccumulativeCoinSelector>());

    ContractBuilder(const ContractBuilder&) = default;
    ContractBuilder(ContractBuilder&& ) noexcept = default;
    virtual ~ContractBuilder() = default;

    ContractBuilder& operator=(const ContractBuilder& ) = default;
    ContractBuilder& operator=(ContractBuilder&& ) noexcept = default;

    const core::AddressCoder& Coder() const noexcept
    { return m_commitment_builder.Coder(); }

    const ICoinSelector& CoinSelector() const noexcept
    { return *m_coin_selector; }

    const IDataSource& DataSource() const noexcept
    { return *m_datasource; }
};

}

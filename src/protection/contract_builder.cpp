#include "contract_builder.hpp"

namespace ordguard::protection {

ContractBuilder::ContractBuilder(core::Network network, core::Chain chain, std::shared_ptr<const IDataSource> datasource,
                                 std::shared_ptr<const ICoinSelector> coin_selector)
    : m_commitment_builder(network, chain)
    , m_datasource(move(datasource)), m_coin_selector(move(coin_selector))
{
    if (!m_datasource) {
        throw InputError("Data source is required");
    }
    if (!m_coin_selector) {
        throw InputError("Coin selector is required");
    }
}

}

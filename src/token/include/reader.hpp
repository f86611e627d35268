#pragma once

#include "address.hpp"
#include "contract_reader.hpp"
#include "metadata.hpp"

namespace tkr::token
{
    /**
     * @brief Read name, symbol, decimals and totalSupply of a token contract.
     *
     * Functions that could not be read are missing from the result. A contract
     * where every call fails yields an empty record.
     */
    TokenMetadata fetchTokenMetadata(const chain::IContractReader & reader, const chain::Address & contract_address);
}

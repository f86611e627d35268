#pragma once

#include <vector>

#include "abi.hpp"
#include "call.hpp"

namespace tkr::token
{
    /**
     * @brief ABI fragment of the token metadata getters.
     *
     * name() -> string, decimals() -> uint8, totalSupply() -> uint256,
     * symbol() -> string. All constant, none payable, no inputs.
     */
    const std::vector<abi::Function> & contractAbi();

    /**
     * @brief Functions queried for every token, each with an empty argument list.
     */
    const chain::ContractFunctions & contractFunctions();
}

#include "reader.hpp"

#include <spdlog/spdlog.h>

#include "functions.hpp"

namespace tkr::token
{
    TokenMetadata fetchTokenMetadata(const chain::IContractReader & reader, const chain::Address & contract_address)
    {
        const std::string address_string = chain::addressToHex(contract_address);

        const chain::CallResults results = reader.queryContract(contract_address, contractAbi(), contractFunctions());
        TokenMetadata metadata = assemble(results, address_string);

        if(metadata.empty())
        {
            spdlog::warn("No token metadata could be read from {}", address_string);
        }

        return metadata;
    }
}

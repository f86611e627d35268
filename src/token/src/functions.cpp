#include "functions.hpp"

namespace tkr::token
{
    const std::vector<abi::Function> & contractAbi()
    {
        // selectors are keccak256(signature)[0:4]
        static const std::vector<abi::Function> abi{
            abi::Function{
                .name = "name",
                .selector = {0x06, 0xfd, 0xde, 0x03},
                .inputs = {},
                .outputs = {abi::Type::STRING},
                .constant = true,
                .payable = false
            },
            abi::Function{
                .name = "decimals",
                .selector = {0x31, 0x3c, 0xe5, 0x67},
                .inputs = {},
                .outputs = {abi::Type::UINT8},
                .constant = true,
                .payable = false
            },
            abi::Function{
                .name = "totalSupply",
                .selector = {0x18, 0x16, 0x0d, 0xdd},
                .inputs = {},
                .outputs = {abi::Type::UINT256},
                .constant = true,
                .payable = false
            },
            abi::Function{
                .name = "symbol",
                .selector = {0x95, 0xd8, 0x9b, 0x41},
                .inputs = {},
                .outputs = {abi::Type::STRING},
                .constant = true,
                .payable = false
            }
        };
        return abi;
    }

    const chain::ContractFunctions & contractFunctions()
    {
        static const chain::ContractFunctions functions{
            {"totalSupply", {}},
            {"decimals", {}},
            {"name", {}},
            {"symbol", {}}
        };
        return functions;
    }
}

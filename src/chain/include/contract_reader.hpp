#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "abi.hpp"
#include "address.hpp"
#include "call.hpp"

namespace tkr::chain
{
    using RpcCall = std::function<std::optional<nlohmann::json>(const std::string & rpc_url, const nlohmann::json & request)>;

    /**
     * @brief JSON-RPC transport through `curl`.
     *
     * Returns the parsed response body (object or batch array), or nullopt
     * when the process fails or the body is not JSON.
     */
    std::optional<nlohmann::json> rpcCallWithCurl(const std::string & rpc_url, const nlohmann::json & request);

    /**
     * Executes read-only contract calls. Each requested function gets its own
     * entry in the result, failed calls included.
     */
    class IContractReader
    {
    public:
        virtual ~IContractReader() = default;

        virtual CallResults queryContract(
            const Address & contract_address,
            const std::vector<abi::Function> & abi,
            const ContractFunctions & functions) const = 0;
    };

    struct ReaderConfig
    {
        std::string rpc_url;
        std::string block_tag = "latest";
    };

    class RpcContractReader final : public IContractReader
    {
    public:
        explicit RpcContractReader(ReaderConfig cfg, RpcCall rpc_call = rpcCallWithCurl);

        const ReaderConfig & config() const noexcept;

        CallResults queryContract(
            const Address & contract_address,
            const std::vector<abi::Function> & abi,
            const ContractFunctions & functions) const override;

    private:
        ReaderConfig _cfg;
        RpcCall _rpc_call;
    };
}

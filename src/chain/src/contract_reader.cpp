#include "contract_reader.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <evmc/hex.hpp>

#include "native.h"
#include "utils.hpp"

namespace tkr::chain
{
    using json = nlohmann::json;

    namespace
    {
        struct PendingCall
        {
            std::string function_name;
            const abi::Function * function = nullptr;
        };

        bool _isRevert(const json & error)
        {
            if(!error.is_object())
            {
                return false;
            }

            if(error.contains("code") && error["code"].is_number_integer() && error["code"].get<std::int64_t>() == 3)
            {
                return true;
            }

            if(error.contains("message") && error["message"].is_string())
            {
                return utils::toLower(error["message"].get<std::string>()).find("revert") != std::string::npos;
            }

            return false;
        }

        FunctionCallResult _decodeResponse(const PendingCall & call, const json & response)
        {
            if(response.contains("error"))
            {
                const json & error = response["error"];
                if(_isRevert(error))
                {
                    return std::unexpected(CallError{
                        .kind = CallError::Kind::REVERTED,
                        .message = std::format("'{}' reverted: {}", call.function_name, error.dump())
                    });
                }

                return std::unexpected(CallError{
                    .kind = CallError::Kind::RPC_ERROR,
                    .message = std::format("RPC error on '{}': {}", call.function_name, error.dump())
                });
            }

            if(!response.contains("result") || !response["result"].is_string())
            {
                return std::unexpected(CallError{
                    .kind = CallError::Kind::RPC_MALFORMED,
                    .message = std::format("Response for '{}' has no string result", call.function_name)
                });
            }

            const std::string result_hex = response["result"].get<std::string>();
            const std::string stripped = utils::stripHexPrefix(result_hex);

            std::vector<std::uint8_t> data;
            if(!stripped.empty())
            {
                const auto bytes_res = evmc::from_hex(stripped);
                if(!bytes_res)
                {
                    return std::unexpected(CallError{
                        .kind = CallError::Kind::RPC_MALFORMED,
                        .message = std::format("Result for '{}' is not hex: {}", call.function_name, result_hex)
                    });
                }
                data.assign(bytes_res->begin(), bytes_res->end());
            }

            auto values_res = abi::decodeOutputs(call.function->outputs, data);
            if(!values_res || values_res->empty())
            {
                return std::unexpected(CallError{
                    .kind = CallError::Kind::DECODE_ERROR,
                    .message = std::format("Cannot decode {} bytes returned by '{}'", data.size(), call.function_name)
                });
            }

            return std::move(*values_res);
        }
    }

    std::optional<json> rpcCallWithCurl(const std::string & rpc_url, const json & request)
    {
        std::vector<std::string> args{
            "-sS",
            "-X", "POST",
            rpc_url,
            "-H", "Content-Type: application/json",
            "--data", request.dump()
        };

        const auto [exit_code, output] = native::runProcess("curl", std::move(args));
        if(exit_code != 0)
        {
            spdlog::error("Chain RPC call failed (exit={}): {}", exit_code, output);
            return std::nullopt;
        }

        json response = json::parse(output, nullptr, false);
        if(response.is_discarded())
        {
            spdlog::error("Chain RPC returned invalid JSON: {}", output);
            return std::nullopt;
        }

        return response;
    }

    RpcContractReader::RpcContractReader(ReaderConfig cfg, RpcCall rpc_call)
        : _cfg(std::move(cfg)), _rpc_call(std::move(rpc_call))
    {
    }

    const ReaderConfig & RpcContractReader::config() const noexcept
    {
        return _cfg;
    }

    CallResults RpcContractReader::queryContract(
        const Address & contract_address,
        const std::vector<abi::Function> & abi,
        const ContractFunctions & functions) const
    {
        CallResults results;

        const std::string to_hex = addressToHex(contract_address);

        std::vector<PendingCall> pending;
        json batch = json::array();

        // sorted so that request ids are stable across runs
        std::vector<std::string> names;
        names.reserve(functions.size());
        for(const auto & entry : functions)
        {
            names.push_back(entry.first);
        }
        std::ranges::sort(names);

        for(const std::string & name : names)
        {
            const abi::Function * function = abi::findFunction(abi, name);
            if(function == nullptr)
            {
                results.insert_or_assign(name, std::unexpected(CallError{
                    .kind = CallError::Kind::INVALID_INPUT,
                    .message = std::format("'{}' is not part of the ABI", name)
                }));
                continue;
            }

            if(!functions.at(name).empty() || !function->inputs.empty())
            {
                results.insert_or_assign(name, std::unexpected(CallError{
                    .kind = CallError::Kind::INVALID_INPUT,
                    .message = std::format("'{}' takes arguments, only argument-less calls are supported", abi::signature(*function))
                }));
                continue;
            }

            batch.push_back({
                {"jsonrpc", "2.0"},
                {"id", pending.size()},
                {"method", "eth_call"},
                {"params", json::array({
                    json{
                        {"to", to_hex},
                        {"data", utils::bytesToHex(function->selector.data(), function->selector.size(), true)}
                    },
                    _cfg.block_tag
                })}
            });
            pending.push_back(PendingCall{.function_name = name, .function = function});
        }

        if(pending.empty())
        {
            return results;
        }

        const auto fail_all = [&results, &pending](CallError::Kind kind, const std::string & message)
        {
            for(const PendingCall & call : pending)
            {
                results.insert_or_assign(call.function_name, std::unexpected(CallError{.kind = kind, .message = message}));
            }
        };

        if(_cfg.rpc_url.empty())
        {
            fail_all(CallError::Kind::INVALID_INPUT, "rpc_url is empty");
            return results;
        }

        spdlog::debug("Querying {} functions of {}", pending.size(), to_hex);

        const auto response = _rpc_call(_cfg.rpc_url, batch);
        if(!response)
        {
            spdlog::warn("eth_call batch for {} failed", to_hex);
            fail_all(CallError::Kind::RPC_ERROR, "eth_call batch failed");
            return results;
        }

        if(response->is_object() && response->contains("error"))
        {
            spdlog::warn("eth_call batch for {} rejected: {}", to_hex, (*response)["error"].dump());
            fail_all(CallError::Kind::RPC_ERROR, std::format("eth_call batch rejected: {}", (*response)["error"].dump()));
            return results;
        }

        if(!response->is_array())
        {
            spdlog::warn("eth_call batch for {} returned malformed response", to_hex);
            fail_all(CallError::Kind::RPC_MALFORMED, "eth_call batch response is not an array");
            return results;
        }

        absl::flat_hash_map<std::size_t, const json *> responses_by_id;
        for(const json & item : *response)
        {
            if(item.is_object() && item.contains("id") && item["id"].is_number_unsigned())
            {
                responses_by_id.insert_or_assign(item["id"].get<std::size_t>(), &item);
            }
        }

        for(std::size_t id = 0; id < pending.size(); ++id)
        {
            const PendingCall & call = pending[id];
            const auto it = responses_by_id.find(id);
            if(it == responses_by_id.end())
            {
                results.insert_or_assign(call.function_name, std::unexpected(CallError{
                    .kind = CallError::Kind::RPC_MALFORMED,
                    .message = std::format("No response for '{}'", call.function_name)
                }));
                continue;
            }

            auto call_res = _decodeResponse(call, *it->second);
            if(!call_res)
            {
                spdlog::debug(std::format("{} of {}: {}: {}", call.function_name, to_hex, call_res.error().kind, call_res.error().message));
            }
            results.insert_or_assign(call.function_name, std::move(call_res));
        }

        return results;
    }
}

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "abi.hpp"

namespace tkr::chain
{
    using AbiValue = abi::Value;

    struct CallError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            INVALID_INPUT,
            RPC_ERROR,
            RPC_MALFORMED,
            REVERTED,
            DECODE_ERROR
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * Outcome of one contract function call: the decoded output values,
     * or the reason the call is unusable.
     */
    using FunctionCallResult = std::expected<std::vector<AbiValue>, CallError>;

    // keyed by function name, as listed in the ABI
    using CallResults = absl::flat_hash_map<std::string, FunctionCallResult>;

    // function name -> call arguments
    using ContractFunctions = absl::flat_hash_map<std::string, std::vector<AbiValue>>;
}

template <>
struct std::formatter<tkr::chain::CallError::Kind> : std::formatter<std::string>
{
    auto format(const tkr::chain::CallError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case tkr::chain::CallError::Kind::INVALID_INPUT:
                return formatter<string>::format("Invalid input", ctx);
            case tkr::chain::CallError::Kind::RPC_ERROR:
                return formatter<string>::format("RPC error", ctx);
            case tkr::chain::CallError::Kind::RPC_MALFORMED:
                return formatter<string>::format("Malformed RPC response", ctx);
            case tkr::chain::CallError::Kind::REVERTED:
                return formatter<string>::format("Call reverted", ctx);
            case tkr::chain::CallError::Kind::DECODE_ERROR:
                return formatter<string>::format("Decode error", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "address.hpp"
#include "call.hpp"

namespace tkr::token
{
    // storage limit for name and symbol, in bytes
    constexpr std::size_t MAX_STRING_BYTES = 255;

    constexpr std::size_t FALLBACK_NAME_LENGTH = 6;

    /**
     * Partial token record. A field is set only when the matching contract
     * call returned exactly one value; nothing is ever defaulted.
     *
     * When present, name and symbol are valid UTF-8 without NUL bytes and at
     * most MAX_STRING_BYTES long.
     */
    struct TokenMetadata
    {
        std::optional<std::string> name;
        std::optional<std::string> symbol;
        std::optional<std::uint8_t> decimals;
        std::optional<evmc::uint256be> total_supply;

        bool empty() const noexcept;
    };

    /**
     * @brief Invalid UTF-8 becomes the first FALLBACK_NAME_LENGTH characters
     *        of the contract address; otherwise NUL bytes are removed.
     */
    std::string repairName(std::string name, std::string_view address_string);

    /**
     * @brief Invalid UTF-8 drops the symbol; otherwise NUL bytes are removed.
     */
    std::optional<std::string> repairSymbol(std::string symbol);

    /**
     * @brief Cut to the first MAX_STRING_BYTES bytes.
     *
     * This is a byte cut. A multi-byte UTF-8 sequence crossing the limit is
     * split, which keeps values identical to the ones already stored.
     */
    std::string enforceLength(std::string text);

    /**
     * @brief Build the sanitized record from raw call results.
     *
     * Never fails: failed calls, calls with zero or several outputs, values of
     * an unexpected type and unknown function names are all left out.
     */
    TokenMetadata assemble(const chain::CallResults & results, std::string_view address_string);

    TokenMetadata assemble(const chain::CallResults & results, const chain::Address & contract_address);

    nlohmann::json toJson(const TokenMetadata & metadata);
}

#include "metadata.hpp"

#include <format>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "math.hpp"
#include "utils.hpp"

namespace tkr::token
{
    using json = nlohmann::json;

    namespace
    {
        enum class Field : std::uint8_t
        {
            NAME,
            SYMBOL,
            DECIMALS,
            TOTAL_SUPPLY
        };

        std::optional<Field> _fieldOf(std::string_view function_name)
        {
            if(function_name == "name")         return Field::NAME;
            if(function_name == "symbol")       return Field::SYMBOL;
            if(function_name == "decimals")     return Field::DECIMALS;
            if(function_name == "totalSupply")  return Field::TOTAL_SUPPLY;
            return std::nullopt;
        }

        template<class T>
        bool _assign(std::optional<T> & field, const chain::AbiValue & value)
        {
            const T * typed = std::get_if<T>(&value);
            if(typed == nullptr)
            {
                return false;
            }
            field = *typed;
            return true;
        }

        bool _take(TokenMetadata & metadata, Field field, const chain::AbiValue & value)
        {
            switch(field)
            {
                case Field::NAME:           return _assign(metadata.name, value);
                case Field::SYMBOL:         return _assign(metadata.symbol, value);
                case Field::DECIMALS:       return _assign(metadata.decimals, value);
                case Field::TOTAL_SUPPLY:   return _assign(metadata.total_supply, value);
            }
            return false;
        }
    }

    bool TokenMetadata::empty() const noexcept
    {
        return !name && !symbol && !decimals && !total_supply;
    }

    std::string repairName(std::string name, std::string_view address_string)
    {
        if(!utils::isValidUtf8(name))
        {
            return std::string(address_string.substr(0, FALLBACK_NAME_LENGTH));
        }
        return utils::removeNullBytes(std::move(name));
    }

    std::optional<std::string> repairSymbol(std::string symbol)
    {
        if(!utils::isValidUtf8(symbol))
        {
            return std::nullopt;
        }
        return utils::removeNullBytes(std::move(symbol));
    }

    std::string enforceLength(std::string text)
    {
        if(text.size() > MAX_STRING_BYTES)
        {
            text.resize(MAX_STRING_BYTES);
        }
        return text;
    }

    TokenMetadata assemble(const chain::CallResults & results, std::string_view address_string)
    {
        TokenMetadata metadata;

        for(const auto & [function_name, result] : results)
        {
            const auto field = _fieldOf(function_name);
            if(!field)
            {
                spdlog::debug("Ignoring unknown function '{}' of {}", function_name, address_string);
                continue;
            }

            if(!result)
            {
                spdlog::debug(std::format("'{}' of {} unavailable: {}", function_name, address_string, result.error().kind));
                continue;
            }

            if(result->size() != 1)
            {
                spdlog::debug("'{}' of {} returned {} values", function_name, address_string, result->size());
                continue;
            }

            if(!_take(metadata, *field, result->front()))
            {
                spdlog::debug("'{}' of {} returned a value of unexpected type", function_name, address_string);
            }
        }

        if(metadata.name)
        {
            metadata.name = enforceLength(repairName(std::move(*metadata.name), address_string));
        }

        if(metadata.symbol)
        {
            metadata.symbol = repairSymbol(std::move(*metadata.symbol));
            if(metadata.symbol)
            {
                metadata.symbol = enforceLength(std::move(*metadata.symbol));
            }
            else
            {
                spdlog::debug("Dropping symbol of {}: not valid UTF-8", address_string);
            }
        }

        return metadata;
    }

    TokenMetadata assemble(const chain::CallResults & results, const chain::Address & contract_address)
    {
        return assemble(results, chain::addressToHex(contract_address));
    }

    json toJson(const TokenMetadata & metadata)
    {
        json out = json::object();
        if(metadata.name)
        {
            out["name"] = *metadata.name;
        }
        if(metadata.symbol)
        {
            out["symbol"] = *metadata.symbol;
        }
        if(metadata.decimals)
        {
            out["decimals"] = *metadata.decimals;
        }
        if(metadata.total_supply)
        {
            out["total_supply"] = utils::uint256ToDecimal(*metadata.total_supply);
        }
        return out;
    }
}

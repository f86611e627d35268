#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tkr::abi
{
    enum class Type : std::uint8_t
    {
        STRING = 0,
        UINT8,
        UINT256
    };

    /**
     * A single decoded value. The alternative follows the declared ABI type:
     * `string` -> std::string (raw bytes, not validated),
     * `uint8` -> std::uint8_t,
     * `uint256` -> evmc::uint256be.
     */
    using Value = std::variant<std::string, std::uint8_t, evmc::uint256be>;

    using Selector = std::array<std::uint8_t, 4>;

    struct Function
    {
        std::string name;
        Selector selector{};

        std::vector<Type> inputs;
        std::vector<Type> outputs;

        bool constant = true;
        bool payable = false;
    };

    std::string_view typeName(Type type);

    std::string signature(const Function & function);

    const Function * findFunction(const std::vector<Function> & abi, std::string_view name);

    nlohmann::json toJson(const std::vector<Function> & abi);

    /**
     * @brief Decode `eth_call` return data against the declared outputs.
     *
     * @return One value per declared output, or nullopt when any word is
     *         missing, out of bounds or out of range for its type.
     */
    std::optional<std::vector<Value>> decodeOutputs(const std::vector<Type> & outputs, const std::vector<std::uint8_t> & data);
}

template <>
struct std::formatter<tkr::abi::Type> : std::formatter<std::string> {
    auto format(const tkr::abi::Type & type, format_context& ctx) const {
        return formatter<string>::format(std::string(tkr::abi::typeName(type)), ctx);
    }
};

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tkr::utils
{
    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    std::optional<std::uint8_t> readUint8Word(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    std::optional<evmc::uint256be> readUint256Word(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    /**
     * @brief Render a big-endian 256-bit unsigned integer in base 10.
     */
    std::string uint256ToDecimal(const evmc::uint256be & value);
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tkr::utils
{
    std::optional<std::string> decodeAbiString(const std::uint8_t* data, std::size_t data_size, std::size_t string_offset);
}

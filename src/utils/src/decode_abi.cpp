#include "decode_abi.hpp"

#include "math.hpp"

namespace tkr::utils
{
    std::optional<std::string> decodeAbiString(const std::uint8_t* data, std::size_t data_size, std::size_t string_offset)
    {
        const auto length_res = utils::readWordAsSizeT(data, data_size, string_offset);
        if(!length_res)
        {
            return std::nullopt;
        }

        const std::size_t length = *length_res;
        if(string_offset + 32 > data_size || length > (data_size - (string_offset + 32)))
        {
            return std::nullopt;
        }

        // raw bytes, no text validation here
        return std::string(reinterpret_cast<const char*>(data + string_offset + 32), length);
    }
}

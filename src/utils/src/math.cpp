#include "math.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace tkr::utils
{
    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        std::size_t value = 0;

        constexpr std::size_t prefix = 32 - sizeof(std::size_t);
        for(std::size_t i = 0; i < prefix; ++i)
        {
            if(data[offset + i] != 0)
            {
                return std::nullopt;
            }
        }

        for(std::size_t i = prefix; i < 32; ++i)
        {
            value = (value << 8) | data[offset + i];
        }

        return value;
    }

    std::optional<std::uint8_t> readUint8Word(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        const auto value_res = utils::readWordAsSizeT(data, data_size, offset);
        if(!value_res || *value_res > 0xFFu)
        {
            return std::nullopt;
        }

        return static_cast<std::uint8_t>(*value_res);
    }

    std::optional<evmc::uint256be> readUint256Word(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        evmc::uint256be value{};
        std::memcpy(value.bytes, data + offset, 32);
        return value;
    }

    std::string uint256ToDecimal(const evmc::uint256be & value)
    {
        std::array<std::uint8_t, 32> work{};
        std::memcpy(work.data(), value.bytes, work.size());

        std::string digits;
        const auto is_zero = [&work]()
        {
            return std::ranges::all_of(work, [](std::uint8_t b) { return b == 0; });
        };

        while(!is_zero())
        {
            // long division of the big-endian number by 10
            std::uint32_t remainder = 0;
            for(std::uint8_t & byte : work)
            {
                const std::uint32_t current = (remainder << 8) | byte;
                byte = static_cast<std::uint8_t>(current / 10);
                remainder = current % 10;
            }
            digits.push_back(static_cast<char>('0' + remainder));
        }

        if(digits.empty())
        {
            return "0";
        }

        std::ranges::reverse(digits);
        return digits;
    }
}

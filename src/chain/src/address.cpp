#include "address.hpp"

#include <cctype>

#include <evmc/hex.hpp>

#include "utils.hpp"

namespace tkr::chain
{
    std::string addressToHex(const chain::Address & address)
    {
        return utils::bytesToHex(address.bytes, sizeof(address.bytes), true);
    }

    std::optional<chain::Address> parseAddress(std::string_view text)
    {
        const std::string hex = utils::stripHexPrefix(std::string(text));
        if(hex.size() != 40)
        {
            return std::nullopt;
        }

        for(const char c : hex)
        {
            if(std::isxdigit(static_cast<unsigned char>(c)) == 0)
            {
                return std::nullopt;
            }
        }

        return evmc::from_hex<chain::Address>(hex);
    }

}

#pragma once

#include <optional>
#include <string>
#include <string_view>


#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tkr::chain
{
    using Address = evmc::address;

    /**
     * @brief Canonical string form: "0x" followed by 40 lowercase hex digits.
     */
    std::string addressToHex(const chain::Address & address);

    std::optional<chain::Address> parseAddress(std::string_view text);

}

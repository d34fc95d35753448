#pragma once

#include <cstdint>
#include <string>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace lens::chain
{
    using Address = evmc::address;

    /**
     * @brief Address held in an ABI word: the low 20 bytes, after 12 bytes of left padding.
     */
    chain::Address wordToAddress(const evmc::bytes32 & word);

    /**
     * @brief Lowercase 0x-prefixed form, 40 hex digits.
     */
    std::string addressToHex(const chain::Address & address);

}

#include <cstring>

#include <evmc/hex.hpp>

#include "address.hpp"

namespace lens::chain
{
    chain::Address wordToAddress(const evmc::bytes32 & word)
    {
        chain::Address addr{};
        std::memcpy(addr.bytes, word.bytes + 12, 20);
        return addr;
    }

    std::string addressToHex(const chain::Address & address)
    {
        return std::string("0x") + evmc::hex(address);
    }

}

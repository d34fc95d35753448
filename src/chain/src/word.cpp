#include "word.hpp"

#include <cstring>

namespace lens::chain
{
    std::optional<evmc::bytes32> readWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < WORD_SIZE)
        {
            return std::nullopt;
        }

        evmc::bytes32 word{};
        std::memcpy(word.bytes, data + offset, WORD_SIZE);
        return word;
    }

    intx::uint256 wordToUint256(const evmc::bytes32 & word)
    {
        return intx::be::unsafe::load<intx::uint256>(word.bytes);
    }

    bool wordToBool(const evmc::bytes32 & word)
    {
        // only the last byte carries the value
        return word.bytes[WORD_SIZE - 1] != 0;
    }
}

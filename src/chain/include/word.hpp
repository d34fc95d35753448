#pragma once

#include <optional>
#include <cstdint>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include <intx/intx.hpp>

namespace lens::chain
{
    /// Width of one ABI slot, in topics and in the data blob alike.
    inline constexpr std::size_t WORD_SIZE = 32;

    /**
     * @brief Copies the word starting at offset.
     * 
     * @return std::nullopt when the word does not fit entirely inside the buffer.
     */
    std::optional<evmc::bytes32> readWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    intx::uint256 wordToUint256(const evmc::bytes32 & word);

    bool wordToBool(const evmc::bytes32 & word);
}

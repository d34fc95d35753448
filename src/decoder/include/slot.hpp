#pragma once

#include <cstdint>
#include <string_view>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include "log_record.hpp"

namespace lens::decoder
{
    /**
     * @brief The fixed-width types the decoder understands.
     * 
     * Any other declared type maps to UNSUPPORTED and renders as a fallback string.
     */
    enum class SlotType : std::uint8_t
    {
        UNSUPPORTED = 0,

        ADDRESS,
        UINT256,
        BOOL,
        BYTES32
    };

    SlotType slotTypeFromString(std::string_view type);

    /**
     * @brief Renders one 32-byte slot according to the declared type.
     * 
     * address -> "0x" + 40 lowercase hex digits (low 20 bytes)
     * uint256 -> decimal string, big-endian, full width
     * bool    -> true when the last byte is nonzero
     * bytes32 -> "0x" + 64 lowercase hex digits
     * other   -> "unsupported type: <type>"
     * 
     * Never fails.
     */
    ArgumentValue decodeSlot(std::string_view type, const evmc::bytes32 & slot);
}

#include "slot.hpp"

#include <format>

#include <evmc/hex.hpp>

#include "address.hpp"
#include "word.hpp"

namespace lens::decoder
{
    SlotType slotTypeFromString(std::string_view type)
    {
        if(type == "address") return SlotType::ADDRESS;
        if(type == "uint256") return SlotType::UINT256;
        if(type == "bool")    return SlotType::BOOL;
        if(type == "bytes32") return SlotType::BYTES32;
        return SlotType::UNSUPPORTED;
    }

    ArgumentValue decodeSlot(std::string_view type, const evmc::bytes32 & slot)
    {
        switch(slotTypeFromString(type))
        {
            case SlotType::ADDRESS:
                return chain::addressToHex(chain::wordToAddress(slot));

            case SlotType::UINT256:
                return intx::to_string(chain::wordToUint256(slot));

            case SlotType::BOOL:
                return chain::wordToBool(slot);

            case SlotType::BYTES32:
                return std::string("0x") + evmc::hex(slot);

            case SlotType::UNSUPPORTED:
            default:
                return std::format("unsupported type: {}", type);
        }
    }
}
